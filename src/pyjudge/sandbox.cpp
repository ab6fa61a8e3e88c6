#include <pyjudge/sandbox.h>

nlohmann::json SandboxJob::ToJson() const {
  return {
    {"entry_point", entry_point},
    {"reference_source", reference_source},
    {"candidate_source", candidate_source},
    {"cases", cases},
    {"stop_on_mismatch", stop_on_mismatch},
    {"clear_logs_per_case", clear_logs_per_case},
    {"max_log_entries", max_log_entries},
    {"time_limit_ms", time_limit_ms},
    {"memory_limit_mb", memory_limit_mb},
    {"allowed_modules", allowed_modules},
  };
}

SandboxJob SandboxJob::FromJson(const nlohmann::json& json) {
  SandboxJob ret;
  json.at("entry_point").get_to(ret.entry_point);
  json.at("reference_source").get_to(ret.reference_source);
  json.at("candidate_source").get_to(ret.candidate_source);
  json.at("cases").get_to(ret.cases);
  json.at("stop_on_mismatch").get_to(ret.stop_on_mismatch);
  json.at("clear_logs_per_case").get_to(ret.clear_logs_per_case);
  json.at("max_log_entries").get_to(ret.max_log_entries);
  json.at("time_limit_ms").get_to(ret.time_limit_ms);
  json.at("memory_limit_mb").get_to(ret.memory_limit_mb);
  json.at("allowed_modules").get_to(ret.allowed_modules);
  return ret;
}

std::string ExecutionOutcome::ErrorDetail() const {
  if (terminal != Terminal::FAULTED) return "";
  if (error_trace.empty()) return error_message;
  return error_message + " \n " + error_trace;
}

ExecutionOutcome Sandbox::Run(const SandboxJob& job) {
  std::vector<ExecutionOutcome> ret = RunAll({job});
  return std::move(ret.front());
}
