#include "sandbox_exec.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <chrono>
#include <climits>
#include <cstring>
#include <memory>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <pyjudge/log_sink.h>
#include "protocol.h"

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

// how often the exit status of a runner with a closed channel is checked
constexpr int kExitPollMs = 10;
// address space the interpreter takes on top of the job's memory limit
constexpr long kInterpreterMarginMb = 64;

inline long ElapsedMs(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

struct Runner {
  const SandboxJob& job;
  ExecutionOutcome& outcome;
  LogSink sink;
  pid_t pid; // pyjudge-jail, leader of its own process group
  int fd;
  bool ready; // time limit is running
  bool done; // outcome settled
  bool eof; // channel closed, exit status pending
  int running_case; // expected value seen, result not yet
  std::string buffer;
  fs::path box;
  Clock::time_point start, deadline;

  Runner(const SandboxJob& job, ExecutionOutcome& outcome) :
      job(job), outcome(outcome), sink(job.max_log_entries),
      pid(-1), fd(-1), ready(false), done(false), eof(false), running_case(-1) {}
};

bool CreateDirs(const fs::path& path) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool SendAll(int fd, const void* data, size_t len) {
  size_t cur = 0;
  while (cur < len) {
    ssize_t n = send(fd, (const char*)data + cur, len - cur, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    cur += n;
  }
  return true;
}

// Kill whatever is left of the runner's process group, reap the jail helper
// and release the box; the outcome must be settled beforehand except for the logs.
void Reap(Runner& r) {
  if (r.fd >= 0) {
    close(r.fd);
    r.fd = -1;
  }
  if (r.pid > 0) {
    kill(-r.pid, SIGKILL);
    kill(r.pid, SIGKILL);
    int status = 0;
    while (waitpid(r.pid, &status, 0) < 0 && errno == EINTR);
    spdlog::debug("Runner pid={} reaped, status={}", r.pid, status);
    r.pid = -1;
  }
  if (!r.box.empty()) RemoveAll(r.box);
  r.outcome.logs = r.sink.Take();
  r.done = true;
}

void Fault(Runner& r, const std::string& message) {
  r.outcome.terminal = Terminal::FAULTED;
  r.outcome.error_message = message;
  r.outcome.elapsed_ms = r.ready ? ElapsedMs(r.start, Clock::now()) : 0;
  r.outcome.fault_case = r.running_case;
  if (r.running_case >= 0) r.outcome.cases.back().error = message;
}

void TimeOut(Runner& r) {
  spdlog::info("Runner pid={} exceeded time limit {}ms", r.pid, r.job.time_limit_ms);
  r.outcome.terminal = Terminal::TIMED_OUT;
  r.outcome.elapsed_ms = r.job.time_limit_ms + 1;
  Reap(r);
}

// Runner exited without a terminal frame; status is the jail helper's, which
// mirrors the runner's
void Exited(Runner& r, int status) {
  pid_t pid = r.pid;
  kill(-pid, SIGKILL);
  r.pid = -1;
  if (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU && r.ready) {
    r.outcome.terminal = Terminal::TIMED_OUT;
    r.outcome.elapsed_ms = r.job.time_limit_ms + 1;
  } else if (WIFSIGNALED(status)) {
    spdlog::warn("Runner pid={} killed by signal {}", pid, WTERMSIG(status));
    Fault(r, std::string("runner killed by signal ") + strsignal(WTERMSIG(status)));
  } else if (WEXITSTATUS(status) == kJailErrorExit) {
    spdlog::warn("Runner pid={} could not be jailed", pid);
    Fault(r, "sandbox could not start the runner");
  } else {
    spdlog::warn("Runner pid={} exited with status {} without result", pid, WEXITSTATUS(status));
    Fault(r, "runner exited with status " + std::to_string(WEXITSTATUS(status)) +
             (r.ready ? "" : " before start"));
  }
  Reap(r);
}

void CheckExited(Runner& r) {
  int status = 0;
  pid_t ret = waitpid(r.pid, &status, WNOHANG);
  if (ret == r.pid) {
    Exited(r, status);
  } else if (ret < 0 && errno != EINTR) {
    spdlog::warn("Runner pid={} wait error: errno={} {}", r.pid, errno, strerror(errno));
    Fault(r, std::string("lost track of runner: ") + strerror(errno));
    r.pid = -1;
    Reap(r);
  }
}

CaseResult& CaseAt(ExecutionOutcome& outcome, int index) {
  if (outcome.cases.empty() || outcome.cases.back().index != index) {
    outcome.cases.emplace_back();
    outcome.cases.back().index = index;
  }
  return outcome.cases.back();
}

// return false on protocol violation
bool HandleFrame(Runner& r, const std::string& line) {
  nlohmann::json frame = nlohmann::json::parse(line, nullptr, false);
  if (frame.is_discarded() || !frame.is_object()) return false;
  try {
    const std::string& type = frame.at("type").get_ref<const std::string&>();
    if (type == "ready") {
      if (r.ready) return false;
      r.ready = true;
      r.start = Clock::now();
      r.deadline = r.start + std::chrono::milliseconds(r.job.time_limit_ms);
      return true;
    }
    // a runner that cannot start reports a fault before "ready"
    if (!r.ready && type != "fault") return false;
    if (type == "clear") {
      r.sink.Clear();
    } else if (type == "log") {
      r.sink.Append(frame.at("text").get<std::string>());
    } else if (type == "expected") {
      r.running_case = frame.at("index").get<int>();
      CaseAt(r.outcome, r.running_case).expected = std::move(frame.at("value"));
    } else if (type == "result") {
      CaseResult& res = CaseAt(r.outcome, frame.at("index").get<int>());
      res.received = std::move(frame.at("received"));
      res.matched = frame.at("matched").get<bool>();
      r.running_case = -1;
    } else if (type == "done") {
      long elapsed = std::max(0L, frame.at("elapsed_ms").get<long>());
      if (elapsed > r.job.time_limit_ms || Clock::now() >= r.deadline) {
        TimeOut(r);
        return true;
      }
      r.outcome.terminal = Terminal::COMPLETED;
      r.outcome.elapsed_ms = elapsed;
      Reap(r);
    } else if (type == "fault") {
      long elapsed = std::max(0L, frame.at("elapsed_ms").get<long>());
      if (r.ready && (elapsed > r.job.time_limit_ms || Clock::now() >= r.deadline)) {
        TimeOut(r);
        return true;
      }
      int index = frame.at("index").get<int>();
      r.outcome.terminal = Terminal::FAULTED;
      r.outcome.elapsed_ms = r.ready ? elapsed : 0;
      r.outcome.error_message = frame.at("message").get<std::string>();
      r.outcome.error_trace = frame.at("trace").get<std::string>();
      r.outcome.fault_case = index;
      if (index >= 0) CaseAt(r.outcome, index).error = r.outcome.ErrorDetail();
      Reap(r);
    } else {
      return false;
    }
  } catch (const nlohmann::json::exception& e) {
    spdlog::debug("Runner pid={} bad frame: {}", r.pid, e.what());
    return false;
  }
  return true;
}

void ReadAvailable(Runner& r) {
  char buf[65536];
  ssize_t n = read(r.fd, buf, sizeof(buf));
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) return;
    spdlog::warn("Runner pid={} read error: errno={} {}", r.pid, errno, strerror(errno));
    Fault(r, std::string("runner channel error: ") + strerror(errno));
    Reap(r);
    return;
  }
  if (n == 0) {
    // the exit status is collected without blocking the other runners
    close(r.fd);
    r.fd = -1;
    r.eof = true;
    CheckExited(r);
    return;
  }
  r.buffer.append(buf, n);
  size_t begin = 0;
  for (size_t pos; !r.done && (pos = r.buffer.find('\n', begin)) != std::string::npos; begin = pos + 1) {
    if (!HandleFrame(r, r.buffer.substr(begin, pos - begin))) {
      spdlog::warn("Runner pid={} sent a malformed frame", r.pid);
      Fault(r, "malformed frame from runner");
      Reap(r);
    }
  }
  if (r.done) return;
  r.buffer.erase(0, begin);
  if (r.buffer.size() > kMaxFrameBytes) {
    Fault(r, "diagnostic output limit exceeded");
    Reap(r);
  }
}

void Spawn(Runner& r, const fs::path& jail_path, const JailOptions& opt, long startup_timeout_ms) {
  std::string path = jail_path.string();
  std::string payload = r.job.ToJson().dump();
  std::vector<uint8_t> options = opt.Serialize();
  long size = options.size();
  bool sent;
  int channel[2], setup[2];
  if (!CreateDirs(r.box)) {
    Fault(r, "cannot create jail root " + r.box.string());
    Reap(r);
    return;
  }
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0) goto err;
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, setup) < 0) {
    close(channel[0]);
    close(channel[1]);
    goto err;
  }
  r.pid = fork();
  if (r.pid < 0) {
    close(channel[0]);
    close(channel[1]);
    close(setup[0]);
    close(setup[1]);
    goto err;
  }
  if (r.pid == 0) {
    // only async-signal-safe calls until exec
    setpgid(0, 0);
    if (channel[1] == kChannelFd) {
      fcntl(kChannelFd, F_SETFD, 0);
    } else if (dup2(channel[1], kChannelFd) < 0) {
      _exit(126);
    }
    if (dup2(setup[1], 0) < 0) _exit(126);
    int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0 || dup2(devnull, 1) < 0 || dup2(devnull, 2) < 0) _exit(126);
    execl(path.c_str(), path.c_str(), nullptr);
    _exit(127);
  }
  // either side may set the group first
  setpgid(r.pid, r.pid);
  close(channel[1]);
  close(setup[1]);
  r.fd = channel[0];
  r.start = Clock::now();
  r.deadline = r.start + std::chrono::milliseconds(startup_timeout_ms);
  spdlog::debug("Runner pid={} started: entry={} cases={} limit={}ms box={}",
                r.pid, r.job.entry_point, r.job.cases.size(), r.job.time_limit_ms, r.box.string());
  sent = SendAll(setup[0], &size, sizeof(size)) && SendAll(setup[0], options.data(), options.size());
  close(setup[0]);
  if (!sent || !SendAll(r.fd, payload.data(), payload.size()) || shutdown(r.fd, SHUT_WR) < 0) {
    // the helper may have died already; its exit status tells more
    spdlog::debug("Runner pid={} did not take the job: errno={} {}", r.pid, errno, strerror(errno));
  }
  return;
err:
  spdlog::warn("Runner spawn error: errno={} {}", errno, strerror(errno));
  Fault(r, std::string("failed to start runner: ") + strerror(errno));
  r.pid = -1;
  Reap(r);
}

} // namespace

ProcessSandbox::ProcessSandbox(const JudgeConfig& config) :
    runner_path_(fs::absolute(config.RunnerPath())),
    jail_path_(fs::absolute(config.JailPath())),
    box_root_(fs::absolute(config.BoxRoot())),
    max_parallel_(config.max_parallel),
    startup_timeout_ms_(config.startup_timeout_ms),
    uid_(config.sandbox_uid),
    gid_(config.sandbox_gid),
    spawned_(0) {}

JailOptions ProcessSandbox::RunnerJail(const SandboxJob& job, const fs::path& box) const {
  JailOptions opt;
  opt.boxdir = box.string();
  opt.command = {runner_path_.string()};
  opt.workdir = "/";
  opt.input = opt.output = opt.error = "/dev/null";
  opt.uid = uid_;
  opt.gid = gid_;
  // outer bound only; the judge kills at its own deadlines first
  opt.cpu_time = (startup_timeout_ms_ + job.time_limit_ms) * 1000;
  opt.wall_time = opt.cpu_time + 1'000'000;
  if (job.memory_limit_mb > 0) opt.vss = (job.memory_limit_mb + kInterpreterMarginMb) * 1024;
  opt.fsize = 1; // runners write no files
  opt.dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin", runner_path_.parent_path().string()};
  opt.FilterDirs();
  return opt;
}

std::vector<ExecutionOutcome> ProcessSandbox::RunAll(const std::vector<SandboxJob>& jobs) {
  std::vector<ExecutionOutcome> outcomes(jobs.size());
  std::vector<std::unique_ptr<Runner>> active;
  size_t next = 0;
  while (true) {
    while (next < jobs.size() && (max_parallel_ <= 0 || (int)active.size() < max_parallel_)) {
      auto runner = std::make_unique<Runner>(jobs[next], outcomes[next]);
      next++;
      runner->box = box_root_ / fmt::format("{}-{}", getpid(), spawned_++);
      Spawn(*runner, jail_path_, RunnerJail(runner->job, runner->box), startup_timeout_ms_);
      if (!runner->done) active.push_back(std::move(runner));
    }
    if (active.empty()) break;

    std::vector<struct pollfd> fds(active.size());
    auto now = Clock::now();
    long timeout = -1;
    for (size_t i = 0; i < active.size(); i++) {
      fds[i] = {active[i]->fd, POLLIN, 0}; // -1 after EOF, ignored by poll
      long left = std::chrono::duration_cast<std::chrono::milliseconds>(
          active[i]->deadline - now).count() + 1;
      if (left < 0) left = 0;
      if (active[i]->eof) left = std::min<long>(left, kExitPollMs);
      if (timeout < 0 || left < timeout) timeout = left;
    }
    if (poll(fds.data(), fds.size(), (int)std::min<long>(timeout, INT_MAX)) < 0 && errno != EINTR) {
      int err = errno;
      spdlog::warn("poll error: errno={} {}", err, strerror(err));
      for (auto& r : active) {
        Fault(*r, std::string("poll failed: ") + strerror(err));
        Reap(*r);
      }
      break;
    }
    for (size_t i = 0; i < active.size(); i++) {
      if (fds[i].revents && active[i]->fd >= 0) ReadAvailable(*active[i]);
    }
    for (auto& r : active) {
      if (!r->done && r->eof) CheckExited(*r);
    }
    now = Clock::now();
    for (auto& r : active) {
      if (r->done || now < r->deadline) continue;
      if (r->ready) {
        TimeOut(*r);
      } else {
        spdlog::warn("Runner pid={} did not start within {}ms", r->pid, startup_timeout_ms_);
        Fault(*r, "runner did not start within " + std::to_string(startup_timeout_ms_) + "ms");
        Reap(*r);
      }
    }
    std::vector<std::unique_ptr<Runner>> still_active;
    for (auto& r : active) {
      if (!r->done) still_active.push_back(std::move(r));
    }
    active.swap(still_active);
  }
  return outcomes;
}
