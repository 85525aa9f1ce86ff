#include <snipbox/paths.h>

fs::path kRunRoot = "/tmp/snipbox_runs";
fs::path kSourceDir = fs::path(SNIPBOX_SOURCE_DIR);

const char kPythonExecutable[] = SNIPBOX_PYTHON_EXECUTABLE;
const char kPythonVersion[] = SNIPBOX_PYTHON_VERSION;

namespace internal {
fs::path kDataDir = fs::path(SNIPBOX_DATA_DIR);
} // internal

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

fs::path WorkerPath() {
  return internal::kDataDir / "snipbox-worker";
}

fs::path RuntimeRecipePath(const fs::path& source_dir) {
  return source_dir / "docker" / "runtime" / "Dockerfile";
}
