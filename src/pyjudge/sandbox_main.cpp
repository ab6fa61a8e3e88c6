#include "interpreter.h"

#include <errno.h>
#include <unistd.h>
#include <new>
#include <chrono>

#include <pyjudge/log_sink.h>
#include <pyjudge/sandbox.h>
#include "protocol.h"

namespace {

using Clock = std::chrono::steady_clock;

void Send(const nlohmann::json& frame) {
  std::string data = frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  data.push_back('\n');
  size_t cur = 0;
  while (cur < data.size()) {
    ssize_t n = write(kChannelFd, data.data() + cur, data.size() - cur);
    if (n < 0) {
      if (errno == EINTR) continue;
      _exit(1); // the judge is gone
    }
    cur += n;
  }
}

void SendFault(int index, const std::string& message, const std::string& trace, long elapsed_ms = 0) {
  Send({{"type", "fault"}, {"index", index}, {"message", message}, {"trace", trace},
        {"elapsed_ms", elapsed_ms}});
}

bool ReadJob(std::string& buf) {
  char tmp[65536];
  while (true) {
    ssize_t n = read(kChannelFd, tmp, sizeof(tmp));
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return true;
    buf.append(tmp, n);
  }
}

void RunJob(const SandboxJob& job, Interpreter& interp, LogSink& sink) {
  auto start = Clock::now();
  auto Elapsed = [&start]() {
    return (long)std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  };
  int current = -1;
  try {
    PyRef candidate = interp.Load(job.candidate_source, "<solution>", "solution", job.entry_point);
    PyRef reference = interp.Load(job.reference_source, "<reference>", "reference", job.entry_point);
    for (size_t i = 0; i < job.cases.size(); i++) {
      current = i;
      if (job.clear_logs_per_case) {
        sink.Clear();
        Send({{"type", "clear"}});
      }
      PyRef expected = interp.Call(reference, job.cases[i]);
      Send({{"type", "expected"}, {"index", current}, {"value", interp.Report(expected)}});
      PyRef received = interp.Call(candidate, job.cases[i]);
      nlohmann::json received_json = interp.Report(received);
      bool matched = interp.Equal(expected, received);
      Send({{"type", "result"}, {"index", current}, {"received", received_json}, {"matched", matched}});
      if (!matched && job.stop_on_mismatch) break;
    }
  } catch (const ScriptError& e) {
    SendFault(current, e.what(), e.Trace(), Elapsed());
    return;
  } catch (const std::bad_alloc&) {
    SendFault(current, "MemoryError: out of memory", "", Elapsed());
    return;
  }
  Send({{"type", "done"}, {"elapsed_ms", Elapsed()}});
}

} // namespace

int main() {
  std::string buf;
  if (!ReadJob(buf)) return 1;
  SandboxJob job;
  try {
    job = SandboxJob::FromJson(nlohmann::json::parse(buf));
  } catch (const nlohmann::json::exception& e) {
    SendFault(-1, std::string("invalid job: ") + e.what(), "");
    return 1;
  }

  LogSink sink(job.max_log_entries);
  auto log = [&sink](std::string line) {
    if (sink.Append(std::move(line))) Send({{"type", "log"}, {"text", sink.Entries().back()}});
  };
  try {
    Interpreter interp(job.allowed_modules, log);
    Send({{"type", "ready"}});
    RunJob(job, interp, sink);
  } catch (const std::runtime_error& e) {
    SendFault(-1, e.what(), "");
    _exit(1);
  }
  // skip interpreter finalization and static destructors
  _exit(0);
}
