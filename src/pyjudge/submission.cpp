#include <pyjudge/submission.h>

#include <regex>

#include <spdlog/spdlog.h>
#include <pyjudge/utils.h>
#include "sandbox_exec.h"

namespace {

const std::regex kIdentifier("[A-Za-z_][A-Za-z0-9_]*");

void ValidateTestCases(const std::vector<nlohmann::json>& cases) {
  for (size_t i = 0; i < cases.size(); i++) {
    if (!cases[i].is_array()) {
      throw ProblemError("test case " + std::to_string(i + 1) + " is not an argument list");
    }
  }
}

std::vector<nlohmann::json> ParseInputs(const nlohmann::json& inputs) {
  nlohmann::json parsed;
  if (inputs.is_string()) {
    parsed = nlohmann::json::parse(inputs.get_ref<const std::string&>(), nullptr, false);
    if (parsed.is_discarded()) throw ProblemError("inputs is not valid JSON");
  } else {
    parsed = inputs;
  }
  if (!parsed.is_array()) throw ProblemError("inputs must be a list of test cases");
  return parsed.get<std::vector<nlohmann::json>>();
}

} // namespace

Problem Problem::FromJson(const nlohmann::json& json) {
  if (!json.is_object()) throw ProblemError("problem must be an object");
  Problem ret;
  auto name = json.find("functionName");
  auto source = json.find("solutionFunction");
  if (name == json.end() || !name->is_string()) throw ProblemError("problem has no functionName");
  if (source == json.end() || !source->is_string()) throw ProblemError("problem has no solutionFunction");
  ret.entry_point = name->get<std::string>();
  ret.reference_source = source->get<std::string>();
  if (auto inputs = json.find("inputs"); inputs != json.end() && !inputs->is_null()) {
    ret.test_cases = ParseInputs(*inputs);
  }
  ret.Validate();
  return ret;
}

void Problem::Validate() const {
  if (!std::regex_match(entry_point, kIdentifier)) {
    throw ProblemError("functionName is not a valid identifier: " + entry_point);
  }
  ValidateTestCases(test_cases);
}

nlohmann::json GradeResult::ToJson() const {
  nlohmann::json failed_json = nullptr;
  if (failed) {
    failed_json = {
      {"testCase", failed->test_case},
      {"input", failed->input},
      {"expected", failed->expected},
      {"received", failed->received},
    };
  }
  return {
    {"success", verdict == Verdict::AC},
    {"verdict", VerdictToAbr(verdict)},
    {"status", VerdictToDesc(verdict)},
    {"logs", logs},
    {"failed", failed_json},
    {"time", time_ms},
    {"limitExceeded", limit_exceeded},
    {"error", error},
    {"errorCase", error_case},
  };
}

nlohmann::json CaseReportsToJson(const std::vector<CaseReport>& reports) {
  nlohmann::json logs = nlohmann::json::array(), times = nlohmann::json::array(),
      results = nlohmann::json::array(), errors = nlohmann::json::array(),
      expecteds = nlohmann::json::array(), limit_exceeded = nlohmann::json::array();
  for (auto& i : reports) {
    logs.push_back(i.logs);
    times.push_back(i.time_ms);
    results.push_back(i.result);
    errors.push_back(i.error);
    expecteds.push_back(i.expected);
    limit_exceeded.push_back(i.limit_exceeded);
  }
  return {
    {"logs", logs},
    {"times", times},
    {"results", results},
    {"errors", errors},
    {"expecteds", expecteds},
    {"limitExceeded", limit_exceeded},
  };
}

Verdict ComposeVerdict(const ExecutionOutcome& outcome) {
  switch (outcome.terminal) {
    case Terminal::TIMED_OUT: return Verdict::TLE;
    case Terminal::FAULTED: return Verdict::RF;
    case Terminal::COMPLETED: {
      for (auto& i : outcome.cases) {
        if (!i.matched) return Verdict::WA;
      }
      return Verdict::AC;
    }
  }
  __builtin_unreachable();
}

Judge::Judge(const JudgeConfig& config) : config_(config) {
  config_.Validate();
  sandbox_ = std::make_unique<ProcessSandbox>(config_);
}

Judge::Judge(const JudgeConfig& config, std::unique_ptr<Sandbox> sandbox) :
    config_(config), sandbox_(std::move(sandbox)) {
  config_.Validate();
}

SandboxJob Judge::MakeJob(const Problem& problem, const std::string& code,
                          std::vector<nlohmann::json> cases, bool stop_on_mismatch) const {
  SandboxJob job;
  job.entry_point = problem.entry_point;
  job.reference_source = problem.reference_source;
  job.candidate_source = code;
  job.cases = std::move(cases);
  job.stop_on_mismatch = stop_on_mismatch;
  job.clear_logs_per_case = stop_on_mismatch;
  job.max_log_entries = config_.max_log_entries;
  job.time_limit_ms = config_.execution_timeout_ms;
  job.memory_limit_mb = config_.memory_limit_mb;
  job.allowed_modules = config_.allowed_modules;
  return job;
}

GradeResult Judge::GradeSubmission(const Problem& problem, const std::string& code) const {
  problem.Validate();
  ExecutionOutcome outcome = sandbox_->Run(MakeJob(problem, code, problem.test_cases, true));

  GradeResult ret;
  ret.verdict = ComposeVerdict(outcome);
  ret.logs = std::move(outcome.logs);
  ret.time_ms = outcome.elapsed_ms;
  switch (outcome.terminal) {
    case Terminal::TIMED_OUT: {
      ret.limit_exceeded = true;
      ret.time_ms = config_.execution_timeout_ms + 1;
      break;
    }
    case Terminal::FAULTED: {
      ret.error = outcome.ErrorDetail();
      ret.error_case = outcome.fault_case + 1;
      break;
    }
    case Terminal::COMPLETED: {
      for (auto& i : outcome.cases) {
        if (i.matched || i.index < 0 || i.index >= (int)problem.test_cases.size()) continue;
        ret.failed = GradeResult::FailedCase{i.index + 1, problem.test_cases[i.index], i.expected, i.received};
        break;
      }
      break;
    }
  }
  ret.cases = std::move(outcome.cases);
  spdlog::info("Graded {}: verdict={} time={}ms evaluated={}/{}", problem.entry_point,
               VerdictToAbr(ret.verdict), ret.time_ms, ret.cases.size(), problem.test_cases.size());
  if (ret.verdict == Verdict::RF) spdlog::debug("Runtime fault: {}", ret.error);
  return ret;
}

std::vector<CaseReport> Judge::GradeEachCase(const Problem& problem, const std::string& code,
                                             const std::vector<nlohmann::json>& test_cases) const {
  if (!std::regex_match(problem.entry_point, kIdentifier)) {
    throw ProblemError("functionName is not a valid identifier: " + problem.entry_point);
  }
  ValidateTestCases(test_cases);
  std::vector<SandboxJob> jobs;
  jobs.reserve(test_cases.size());
  for (auto& i : test_cases) jobs.push_back(MakeJob(problem, code, {i}, false));
  std::vector<ExecutionOutcome> outcomes = sandbox_->RunAll(jobs);

  std::vector<CaseReport> ret(test_cases.size());
  for (size_t i = 0; i < ret.size() && i < outcomes.size(); i++) {
    ExecutionOutcome& outcome = outcomes[i];
    CaseReport& report = ret[i];
    report.logs = std::move(outcome.logs);
    report.time_ms = outcome.elapsed_ms;
    report.limit_exceeded = outcome.terminal == Terminal::TIMED_OUT;
    if (outcome.cases.size()) {
      report.expected = outcome.cases[0].expected;
      report.result = outcome.cases[0].received;
      report.matched = outcome.cases[0].matched;
    }
    report.error = outcome.ErrorDetail();
    spdlog::debug("Case {} of {}: {} time={}ms", i + 1, problem.entry_point,
                  TerminalName(outcome.terminal), report.time_ms);
  }
  return ret;
}
