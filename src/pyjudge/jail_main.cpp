#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <stdexcept>

#include "jail.h"
#include "protocol.h"

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  size_t cur = 0;
  while (cur < len) {
    ssize_t n = read(fd, (char*)buf + cur, len - cur);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    cur += n;
  }
  return true;
}

struct cjail_result JailExec(const JailOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

// Leave the way the jailed runner did, so the judge reads its status from ours
[[noreturn]] void Mirror(const struct cjail_result& res) {
  int sig = 0;
  if (res.timekill) {
    sig = SIGXCPU;
  } else if (res.oomkill > 0) {
    sig = SIGKILL;
  } else if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    sig = res.info.si_status;
  }
  if (sig) {
    struct rlimit no_core = {0, 0};
    setrlimit(RLIMIT_CORE, &no_core);
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, sig);
    sigprocmask(SIG_UNBLOCK, &set, nullptr);
    signal(sig, SIG_DFL);
    raise(sig);
    _exit(128 + sig);
  }
  _exit(res.info.si_status);
}

} // namespace

// pyjudge-jail: reads serialized JailOptions from stdin and runs the runner
// inside cjail; every other descriptor, the channel included, is inherited.
int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0 || sz > kMaxJailOptionsBytes) return kJailErrorExit;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return kJailErrorExit;
  struct cjail_result res;
  try {
    res = JailExec(JailOptions(buf));
  } catch (const std::out_of_range&) {
    return kJailErrorExit;
  }
  if (res.timekill == -1) return kJailErrorExit;
  Mirror(res);
}
