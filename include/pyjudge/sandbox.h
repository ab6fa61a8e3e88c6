#ifndef INCLUDE_PYJUDGE_SANDBOX_H_
#define INCLUDE_PYJUDGE_SANDBOX_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#define ENUM_TERMINAL_ \
  X(COMPLETED) \
  X(TIMED_OUT) \
  X(FAULTED)
enum class Terminal {
#define X(name) name,
  ENUM_TERMINAL_
#undef X
};

// One block of reference code and one block of candidate code, plus the cases
// to drive them with. Everything the runner needs travels in here.
struct SandboxJob {
  std::string entry_point;
  std::string reference_source;
  std::string candidate_source;
  std::vector<nlohmann::json> cases; // argument tuples
  bool stop_on_mismatch;
  bool clear_logs_per_case; // logs are scoped to the case being evaluated
  long max_log_entries;
  long time_limit_ms;
  long memory_limit_mb; // 0 = unlimited
  std::vector<std::string> allowed_modules;

  SandboxJob() :
      stop_on_mismatch(true),
      clear_logs_per_case(true),
      max_log_entries(0),
      time_limit_ms(0),
      memory_limit_mb(0) {}

  nlohmann::json ToJson() const;
  static SandboxJob FromJson(const nlohmann::json&);
};

struct CaseResult {
  int index;
  nlohmann::json expected, received;
  bool matched;
  std::string error; // empty if none

  CaseResult() : index(-1), matched(false) {}
};

struct ExecutionOutcome {
  Terminal terminal;
  std::vector<std::string> logs;
  long elapsed_ms;
  // evaluated prefix of the job's cases
  std::vector<CaseResult> cases;
  std::string error_message, error_trace;
  int fault_case; // index of the case running when faulted; -1 if outside cases

  ExecutionOutcome() : terminal(Terminal::COMPLETED), elapsed_ms(0), fault_case(-1) {}

  // message and trace as one string; empty if not faulted
  std::string ErrorDetail() const;
};

// An isolated execution backend. Each job runs in a fresh context; nothing is
// shared between jobs or with the caller.
class Sandbox {
 public:
  virtual ~Sandbox() = default;

  // Run all jobs concurrently; outcomes are in job order
  virtual std::vector<ExecutionOutcome> RunAll(const std::vector<SandboxJob>&) = 0;

  ExecutionOutcome Run(const SandboxJob& job);
};

const char* TerminalName(Terminal);

#endif  // INCLUDE_PYJUDGE_SANDBOX_H_
