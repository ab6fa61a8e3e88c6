#ifndef INCLUDE_PYJUDGE_PATHS_H_
#define INCLUDE_PYJUDGE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// per-runner jail roots are created under here
extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// helper executable that hosts one interpreter per job
fs::path DefaultRunnerPath();
// helper executable that starts a runner inside cjail
fs::path DefaultJailPath();

#endif  // INCLUDE_PYJUDGE_PATHS_H_
