#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <pyjudge/config.h>
#include <pyjudge/sandbox.h>

JudgeConfig TestConfig(long timeout_ms = 2000, long max_log_entries = 10);

SandboxJob TestJob(const std::string& reference, const std::string& candidate,
                   std::vector<nlohmann::json> cases, const std::string& entry_point = "add");

// Hands out canned outcomes and remembers the jobs it was given
class FakeSandbox : public Sandbox {
  std::vector<ExecutionOutcome> outcomes_;
 public:
  std::vector<SandboxJob> jobs;
  int calls;

  explicit FakeSandbox(std::vector<ExecutionOutcome> outcomes) :
      outcomes_(std::move(outcomes)), calls(0) {}

  std::vector<ExecutionOutcome> RunAll(const std::vector<SandboxJob>& jobs_) override;
};

ExecutionOutcome Completed(std::vector<CaseResult> cases, long elapsed_ms = 5);
ExecutionOutcome Faulted(int fault_case, const std::string& message, const std::string& trace = "");
ExecutionOutcome TimedOut(long limit_ms);
CaseResult Case(int index, nlohmann::json expected, nlohmann::json received);

#endif // TEST_UTILS_H_
