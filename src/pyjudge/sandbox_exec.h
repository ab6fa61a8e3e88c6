#ifndef PYJUDGE_SANDBOX_EXEC_H_
#define PYJUDGE_SANDBOX_EXEC_H_

#include <filesystem>

#include <pyjudge/config.h>
#include <pyjudge/sandbox.h>
#include "jail.h"

// Runs every job in its own pyjudge-runner process (a fresh interpreter),
// started through pyjudge-jail in a private root under box_root.
// All runners of a RunAll call are multiplexed by a single poll() loop in the
// calling thread; each one is killed once its wall-clock limit passes.
class ProcessSandbox : public Sandbox {
  std::filesystem::path runner_path_, jail_path_, box_root_;
  int max_parallel_; // 0 = unlimited
  long startup_timeout_ms_;
  int uid_, gid_;
  long spawned_;
 public:
  explicit ProcessSandbox(const JudgeConfig& config);

  std::vector<ExecutionOutcome> RunAll(const std::vector<SandboxJob>&) override;

  // jail settings of one runner whose root is box
  JailOptions RunnerJail(const SandboxJob& job, const std::filesystem::path& box) const;
};

#endif  // PYJUDGE_SANDBOX_EXEC_H_
