#include <pyjudge/config.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/ranges.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <pyjudge/paths.h>

const std::vector<std::string> kDefaultAllowedModules = {
  "math", "cmath", "itertools", "functools", "collections", "heapq",
  "bisect", "string", "re", "operator", "fractions", "decimal", "statistics",
  "typing", "dataclasses", "array", "copy",
};

namespace {

// empty optional value -> fallback; otherwise must be an integer in [min_value, max_value]
long ReadLong(tortellini::ini& ini, const char* key, long fallback, long min_value, long max_value,
              bool required) {
  std::string str = ini[""][key] | "";
  if (str.empty()) {
    if (required) throw ConfigError(std::string("missing required option ") + key);
    return fallback;
  }
  errno = 0;
  char* end = nullptr;
  long ret = strtol(str.c_str(), &end, 10);
  if (errno == ERANGE || end == str.c_str() || *end != '\0') {
    throw ConfigError(std::string("option ") + key + " is not an integer: " + str);
  }
  if (ret < min_value || ret > max_value) {
    throw ConfigError(std::string("option ") + key + " must be in [" + std::to_string(min_value) +
                      ", " + std::to_string(max_value) + "], got " + str);
  }
  return ret;
}

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    size_t l = item.find_first_not_of(" \t"), r = item.find_last_not_of(" \t");
    if (l == std::string::npos) continue;
    ret.push_back(item.substr(l, r - l + 1));
  }
  return ret;
}

void CheckRange(const char* key, long val, long min_value, long max_value) {
  if (val < min_value || val > max_value) {
    throw ConfigError(std::string(key) + " must be in [" + std::to_string(min_value) + ", " +
                      std::to_string(max_value) + "], got " + std::to_string(val));
  }
}

} // namespace

void JudgeConfig::Validate() const {
  CheckRange("max_log_entries", max_log_entries, 1, INT_MAX);
  CheckRange("execution_timeout_ms", execution_timeout_ms, 1, kMaxTimeoutMs);
  CheckRange("memory_limit_mb", memory_limit_mb, 0, kMaxMemoryLimitMb);
  CheckRange("max_parallel", max_parallel, 0, INT_MAX);
  CheckRange("startup_timeout_ms", startup_timeout_ms, 1, kMaxTimeoutMs);
  CheckRange("sandbox_uid", sandbox_uid, 0, INT_MAX);
  CheckRange("sandbox_gid", sandbox_gid, 0, INT_MAX);
}

std::filesystem::path JudgeConfig::BoxRoot() const {
  return box_root.empty() ? kBoxRoot : box_root;
}

std::filesystem::path JudgeConfig::RunnerPath() const {
  return runner_path.empty() ? DefaultRunnerPath() : runner_path;
}

std::filesystem::path JudgeConfig::JailPath() const {
  return jail_path.empty() ? DefaultJailPath() : jail_path;
}

JudgeConfig ParseConfig(std::istream& in) {
  tortellini::ini ini;
  in >> ini;
  JudgeConfig ret;
  ret.max_log_entries = ReadLong(ini, "max_log_entries", 0, 1, INT_MAX, true);
  ret.execution_timeout_ms = ReadLong(ini, "execution_timeout_ms", 0, 1, kMaxTimeoutMs, true);
  ret.memory_limit_mb = ReadLong(ini, "memory_limit_mb", ret.memory_limit_mb, 0, kMaxMemoryLimitMb, false);
  ret.max_parallel = (int)ReadLong(ini, "max_parallel", ret.max_parallel, 0, INT_MAX, false);
  ret.startup_timeout_ms = ReadLong(ini, "startup_timeout_ms", ret.startup_timeout_ms, 1, kMaxTimeoutMs, false);
  ret.sandbox_uid = (int)ReadLong(ini, "sandbox_uid", ret.sandbox_uid, 0, INT_MAX, false);
  ret.sandbox_gid = (int)ReadLong(ini, "sandbox_gid", ret.sandbox_gid, 0, INT_MAX, false);
  if (std::string modules = ini[""]["allowed_modules"] | ""; modules.size()) {
    ret.allowed_modules = SplitList(modules);
  }
  if (std::string box_root = ini[""]["box_root"] | ""; box_root.size()) {
    ret.box_root = box_root;
  }
  if (std::string runner = ini[""]["runner_path"] | ""; runner.size()) {
    ret.runner_path = runner;
  }
  if (std::string jail = ini[""]["jail_path"] | ""; jail.size()) {
    ret.jail_path = jail;
  }
  ret.Validate();
  spdlog::debug("Config: max_log_entries={} execution_timeout_ms={} memory_limit_mb={} max_parallel={}",
                ret.max_log_entries, ret.execution_timeout_ms, ret.memory_limit_mb, ret.max_parallel);
  spdlog::debug("Config: allowed_modules={}", fmt::format("{}", ret.allowed_modules));
  spdlog::debug("Config: box_root={} sandbox_uid={} sandbox_gid={}",
                ret.BoxRoot().string(), ret.sandbox_uid, ret.sandbox_gid);
  return ret;
}

JudgeConfig ParseConfig(const std::filesystem::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) throw ConfigError("cannot open configuration file " + conf_path.string());
  return ParseConfig(fin);
}
