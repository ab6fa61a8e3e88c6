#include <pyjudge/logger.h>

#include <pthread.h>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// Runners are forked while other threads may be logging; hold the console
// mutex across fork() so the child never inherits it locked.
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  static std::once_flag once;
  spdlog::set_pattern("[%t] %+");
  std::call_once(once, []() {
    spdlog::debug("Setup logger pthread_atfork");
    pthread_atfork(Prepare, Release, Release);
  });
}
