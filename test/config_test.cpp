#include <sstream>
#include <algorithm>

#include <gtest/gtest.h>
#include <pyjudge/config.h>
#include <pyjudge/paths.h>

namespace {

JudgeConfig Parse(const std::string& text) {
  std::istringstream in(text);
  return ParseConfig(in);
}

} // namespace

TEST(Config, RequiredOnly) {
  JudgeConfig config = Parse("max_log_entries = 5\nexecution_timeout_ms = 300\n");
  EXPECT_EQ(config.max_log_entries, 5);
  EXPECT_EQ(config.execution_timeout_ms, 300);
  EXPECT_EQ(config.memory_limit_mb, 256);
  EXPECT_EQ(config.max_parallel, 0);
  EXPECT_EQ(config.startup_timeout_ms, 10000);
  EXPECT_EQ(config.allowed_modules, kDefaultAllowedModules);
  EXPECT_EQ(config.RunnerPath(), DefaultRunnerPath());
  EXPECT_EQ(config.JailPath(), DefaultJailPath());
  EXPECT_EQ(config.BoxRoot(), kBoxRoot);
  EXPECT_EQ(config.sandbox_uid, 65534);
  EXPECT_EQ(config.sandbox_gid, 65534);
}

TEST(Config, DefaultModulesCoverTyping) {
  for (const char* name : {"typing", "dataclasses", "array", "copy", "math", "collections"}) {
    EXPECT_NE(std::find(kDefaultAllowedModules.begin(), kDefaultAllowedModules.end(), name),
              kDefaultAllowedModules.end()) << name;
  }
}

TEST(Config, Optional) {
  JudgeConfig config = Parse(
      "max_log_entries = 5\n"
      "execution_timeout_ms = 300\n"
      "memory_limit_mb = 0\n"
      "max_parallel = 4\n"
      "allowed_modules = math, heapq ,re\n"
      "runner_path = /opt/runner\n"
      "jail_path = /opt/jail\n"
      "box_root = /var/tmp/box\n"
      "sandbox_uid = 50000\n"
      "sandbox_gid = 50001\n");
  EXPECT_EQ(config.memory_limit_mb, 0);
  EXPECT_EQ(config.max_parallel, 4);
  EXPECT_EQ(config.allowed_modules, (std::vector<std::string>{"math", "heapq", "re"}));
  EXPECT_EQ(config.RunnerPath(), fs::path("/opt/runner"));
  EXPECT_EQ(config.JailPath(), fs::path("/opt/jail"));
  EXPECT_EQ(config.BoxRoot(), fs::path("/var/tmp/box"));
  EXPECT_EQ(config.sandbox_uid, 50000);
  EXPECT_EQ(config.sandbox_gid, 50001);
}

TEST(Config, MissingRequired) {
  EXPECT_THROW(Parse("execution_timeout_ms = 300\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\n"), ConfigError);
  EXPECT_THROW(Parse(""), ConfigError);
}

TEST(Config, InvalidValues) {
  EXPECT_THROW(Parse("max_log_entries = 0\nexecution_timeout_ms = 300\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = -1\nexecution_timeout_ms = 300\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = ten\nexecution_timeout_ms = 300\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 1.5\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 300\nmax_parallel = -2\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 300\nsandbox_uid = -1\n"), ConfigError);
}

TEST(Config, OutOfRange) {
  // would not fit the int the executor hands to poll() or the runner count
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 300\nmax_parallel = 4294967296\n"),
               ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 3000000000\n"), ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 300\nstartup_timeout_ms = 86400001\n"),
               ConfigError);
  EXPECT_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 300\nmemory_limit_mb = 1099511627776\n"),
               ConfigError);
  EXPECT_NO_THROW(Parse("max_log_entries = 5\nexecution_timeout_ms = 86400000\n"));

  JudgeConfig config;
  config.max_log_entries = 1;
  config.execution_timeout_ms = kMaxTimeoutMs + 1;
  EXPECT_THROW(config.Validate(), ConfigError);
  config.execution_timeout_ms = kMaxTimeoutMs;
  EXPECT_NO_THROW(config.Validate());
  config.max_log_entries = 1L << 40;
  EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(Config, Validate) {
  JudgeConfig config;
  EXPECT_THROW(config.Validate(), ConfigError);
  config.max_log_entries = 1;
  EXPECT_THROW(config.Validate(), ConfigError);
  config.execution_timeout_ms = 1;
  EXPECT_NO_THROW(config.Validate());
  config.startup_timeout_ms = 0;
  EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(Config, MissingFile) {
  EXPECT_THROW(ParseConfig(fs::path("/nonexistent/pyjudge.conf")), ConfigError);
}
