#ifndef INCLUDE_PYJUDGE_CONFIG_H_
#define INCLUDE_PYJUDGE_CONFIG_H_

#include <string>
#include <vector>
#include <iosfwd>
#include <stdexcept>
#include <filesystem>

// Missing or invalid limits; fatal at startup
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

extern const std::vector<std::string> kDefaultAllowedModules;

// upper bounds accepted by Validate
constexpr long kMaxTimeoutMs = 86'400'000;
constexpr long kMaxMemoryLimitMb = 1L << 20;

struct JudgeConfig {
  // required; 0 means "not configured" and fails validation
  long max_log_entries;
  long execution_timeout_ms;
  // optional
  long memory_limit_mb; // 0 = unlimited
  int max_parallel; // runners alive at once; 0 = unlimited
  long startup_timeout_ms;
  std::vector<std::string> allowed_modules;
  // runners are jailed under box_root as this user
  int sandbox_uid, sandbox_gid;
  std::filesystem::path box_root; // empty = kBoxRoot
  std::filesystem::path runner_path; // empty = DefaultRunnerPath()
  std::filesystem::path jail_path; // empty = DefaultJailPath()

  JudgeConfig() :
      max_log_entries(0),
      execution_timeout_ms(0),
      memory_limit_mb(256),
      max_parallel(0),
      startup_timeout_ms(10'000),
      allowed_modules(kDefaultAllowedModules),
      sandbox_uid(65534), sandbox_gid(65534) {}

  // throws ConfigError
  void Validate() const;
  std::filesystem::path BoxRoot() const;
  std::filesystem::path RunnerPath() const;
  std::filesystem::path JailPath() const;
};

// INI file; keys live in the global section. Throws ConfigError.
JudgeConfig ParseConfig(const std::filesystem::path& conf_path);
JudgeConfig ParseConfig(std::istream& in);

#endif  // INCLUDE_PYJUDGE_CONFIG_H_
