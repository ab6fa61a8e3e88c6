#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <pyjudge/config.h>
#include <pyjudge/logger.h>
#include <pyjudge/submission.h>

namespace {

constexpr int kExitConfig = 1;
constexpr int kExitRequest = 2;

struct Options {
  JudgeConfig config;
  std::string mode;
  std::string request;
};

Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "pyjudge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/pyjudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum runner processes alive at once");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall-clock limit of one execution in milliseconds");
  parser.add_argument("mode")
    .help("\"submit\" to grade all cases at once, \"test\" to run each case separately");
  parser.add_argument("request")
    .help("Request JSON file, or \"-\" for standard input");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitConfig);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  Options ret;
  ret.mode = parser.get<std::string>("mode");
  ret.request = parser.get<std::string>("request");
  if (ret.mode != "submit" && ret.mode != "test") {
    std::cerr << "Unknown mode " << ret.mode << std::endl;
    std::cerr << parser;
    exit(kExitConfig);
  }
  std::filesystem::path config_file = parser.get<std::string>("--config");
  try {
    ret.config = ParseConfig(config_file);
    if (auto val = parser.present<int>("--parallel")) ret.config.max_parallel = val.value();
    if (auto val = parser.present<long>("--timeout")) ret.config.execution_timeout_ms = val.value();
    ret.config.Validate();
  } catch (const ConfigError& e) {
    spdlog::error("Invalid configuration {}: {}", config_file.string(), e.what());
    exit(kExitConfig);
  }
  return ret;
}

nlohmann::json ReadRequest(const std::string& path) {
  std::string text;
  if (path == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream fin(path);
    if (!fin) throw ProblemError("cannot open request " + path);
    text.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  }
  nlohmann::json ret = nlohmann::json::parse(text, nullptr, false);
  if (ret.is_discarded() || !ret.is_object()) throw ProblemError("request is not a JSON object");
  return ret;
}

std::string RequireString(const nlohmann::json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string()) {
    throw ProblemError(std::string("request has no ") + key);
  }
  return it->get<std::string>();
}

nlohmann::json Serve(const Judge& judge, const std::string& mode, const nlohmann::json& request) {
  auto problem_it = request.find("problem");
  if (problem_it == request.end()) throw ProblemError("request has no problem");
  Problem problem = Problem::FromJson(*problem_it);
  std::string code = RequireString(request, "code");
  if (mode == "submit") return judge.GradeSubmission(problem, code).ToJson();

  auto cases_it = request.find("testCases");
  if (cases_it == request.end() || !cases_it->is_array()) {
    throw ProblemError("request has no testCases");
  }
  std::vector<nlohmann::json> test_cases = cases_it->get<std::vector<nlohmann::json>>();
  return CaseReportsToJson(judge.GradeEachCase(problem, code, test_cases));
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  Options options = ParseArgs(argc, argv);
  Judge judge(options.config);
  try {
    nlohmann::json response = Serve(judge, options.mode, ReadRequest(options.request));
    std::cout << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } catch (const ProblemError& e) {
    spdlog::info("Rejected request: {}", e.what());
    std::cout << nlohmann::json{{"message", e.what()}}.dump() << std::endl;
    return kExitRequest;
  }
  return 0;
}
