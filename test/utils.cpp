#include "utils.h"

JudgeConfig TestConfig(long timeout_ms, long max_log_entries) {
  JudgeConfig config;
  config.execution_timeout_ms = timeout_ms;
  config.max_log_entries = max_log_entries;
  return config;
}

SandboxJob TestJob(const std::string& reference, const std::string& candidate,
                   std::vector<nlohmann::json> cases, const std::string& entry_point) {
  JudgeConfig config = TestConfig();
  SandboxJob job;
  job.entry_point = entry_point;
  job.reference_source = reference;
  job.candidate_source = candidate;
  job.cases = std::move(cases);
  job.max_log_entries = config.max_log_entries;
  job.time_limit_ms = config.execution_timeout_ms;
  job.memory_limit_mb = config.memory_limit_mb;
  job.allowed_modules = config.allowed_modules;
  return job;
}

std::vector<ExecutionOutcome> FakeSandbox::RunAll(const std::vector<SandboxJob>& jobs_) {
  calls++;
  jobs.insert(jobs.end(), jobs_.begin(), jobs_.end());
  std::vector<ExecutionOutcome> ret = outcomes_;
  ret.resize(jobs_.size());
  return ret;
}

CaseResult Case(int index, nlohmann::json expected, nlohmann::json received) {
  CaseResult ret;
  ret.index = index;
  ret.matched = expected == received;
  ret.expected = std::move(expected);
  ret.received = std::move(received);
  return ret;
}

ExecutionOutcome Completed(std::vector<CaseResult> cases, long elapsed_ms) {
  ExecutionOutcome ret;
  ret.terminal = Terminal::COMPLETED;
  ret.cases = std::move(cases);
  ret.elapsed_ms = elapsed_ms;
  return ret;
}

ExecutionOutcome Faulted(int fault_case, const std::string& message, const std::string& trace) {
  ExecutionOutcome ret;
  ret.terminal = Terminal::FAULTED;
  ret.fault_case = fault_case;
  ret.error_message = message;
  ret.error_trace = trace;
  return ret;
}

ExecutionOutcome TimedOut(long limit_ms) {
  ExecutionOutcome ret;
  ret.terminal = Terminal::TIMED_OUT;
  ret.elapsed_ms = limit_ms + 1;
  return ret;
}
