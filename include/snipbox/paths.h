#ifndef INCLUDE_SNIPBOX_PATHS_H_
#define INCLUDE_SNIPBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// scratch directories of local runs
extern fs::path kRunRoot;
// build context of the fallback runtime image
extern fs::path kSourceDir;

// interpreter the worker was built against; environments are created from it
extern const char kPythonExecutable[];
extern const char kPythonVersion[];

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path SandboxExecPath();
fs::path WorkerPath();
fs::path RuntimeRecipePath(const fs::path& source_dir = kSourceDir);

#endif  // INCLUDE_SNIPBOX_PATHS_H_
