#include <pyjudge/paths.h>

fs::path kBoxRoot = "/tmp/pyjudge_box";

namespace internal {
fs::path kDataDir = fs::path(PYJUDGE_DATA_DIR);
} // internal

fs::path DefaultRunnerPath() {
  return internal::kDataDir / "pyjudge-runner";
}

fs::path DefaultJailPath() {
  return internal::kDataDir / "pyjudge-jail";
}
