#ifndef INCLUDE_PYJUDGE_SUBMISSION_H_
#define INCLUDE_PYJUDGE_SUBMISSION_H_

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <pyjudge/config.h>
#include <pyjudge/sandbox.h>

// Malformed problem or request; reported to the caller as a request failure
class ProblemError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(RF, "RF", "Runtime Fault")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

class Problem {
 public:
  std::string entry_point;
  std::string reference_source;
  std::vector<nlohmann::json> test_cases; // each one is an argument tuple

  // {functionName, solutionFunction, inputs}; inputs may be serialized JSON text
  static Problem FromJson(const nlohmann::json&);
  // throws ProblemError
  void Validate() const;
};

// Batch mode result
struct GradeResult {
  struct FailedCase {
    int test_case; // 1-based
    nlohmann::json input, expected, received;
  };
  Verdict verdict;
  std::vector<CaseResult> cases;
  std::vector<std::string> logs; // of the last evaluated case
  long time_ms;
  bool limit_exceeded;
  std::optional<FailedCase> failed; // first mismatching case
  std::string error;
  int error_case; // 1-based; 0 if the fault happened outside the cases

  GradeResult() :
      verdict(Verdict::NUL), time_ms(0), limit_exceeded(false), error_case(0) {}

  nlohmann::json ToJson() const;
};

// Per-case mode result; one per input case
struct CaseReport {
  std::vector<std::string> logs;
  long time_ms;
  nlohmann::json result, expected;
  std::string error; // empty if none
  bool matched;
  bool limit_exceeded;

  CaseReport() : time_ms(0), matched(false), limit_exceeded(false) {}
};

// {logs[], times[], results[], errors[], expecteds[], limitExceeded[]}
nlohmann::json CaseReportsToJson(const std::vector<CaseReport>&);

Verdict ComposeVerdict(const ExecutionOutcome&);

class Judge {
  JudgeConfig config_;
  std::unique_ptr<Sandbox> sandbox_;

  SandboxJob MakeJob(const Problem&, const std::string& code,
                     std::vector<nlohmann::json> cases, bool stop_on_mismatch) const;
 public:
  // throws ConfigError
  explicit Judge(const JudgeConfig& config);
  Judge(const JudgeConfig& config, std::unique_ptr<Sandbox> sandbox);

  const JudgeConfig& Config() const { return config_; }

  // All cases in one execution; stops at the first mismatch
  GradeResult GradeSubmission(const Problem&, const std::string& code) const;
  // One independent execution per case, run concurrently; never short-circuits
  std::vector<CaseReport> GradeEachCase(const Problem&, const std::string& code,
                                        const std::vector<nlohmann::json>& test_cases) const;
};

#endif  // INCLUDE_PYJUDGE_SUBMISSION_H_
