#include <snipbox/local_engine.h>

#include <unistd.h>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <snipbox/errors.h>
#include <snipbox/paths.h>
#include <snipbox/process.h>
#include "packages.h"
#include "worker.h"
#include "utils.h"

namespace {

const char kPackageMarker[] = ".snipbox_packages.txt";
const int kNobody = 65534;
const long kCreateTimeoutMs = 300'000;
const long kInstallTimeoutMs = 1'800'000;
const size_t kCommandOutputLimit = 1 << 20;

std::string MarkerContent(const std::vector<std::string>& packages) {
  std::string ret;
  for (auto& i : packages) ret += i + "\n";
  return ret;
}

} // namespace

LocalEngine::LocalEngine(LocalEngineOptions opt) : opt_(std::move(opt)), prepared_(false) {
  if (Trim(opt_.env_dir.string()).empty()) {
    throw ConfigError("LocalEngine requires a non-empty environment directory");
  }
  packages_ = NormalizePinnedPackages(opt_.packages);
  if (opt_.run_root.empty()) opt_.run_root = kRunRoot;
  if (opt_.uid < 0) opt_.uid = geteuid() == 0 ? kNobody : getuid();
  if (opt_.gid < 0) opt_.gid = geteuid() == 0 ? kNobody : getgid();
}

fs::path LocalEngine::InterpreterPath() const {
  return opt_.env_dir / "bin" / "python";
}

bool LocalEngine::CreateEnvironment(std::string& error) {
  CommandOptions cmd_opt;
  cmd_opt.timeout_ms = kCreateTimeoutMs;
  cmd_opt.max_output = kCommandOutputLimit;
  if (opt_.creator == EnvCreator::UV) {
    if (CommandExists("uv")) {
      auto res = RunCommand({"uv", "venv", "--python", kPythonExecutable, opt_.env_dir.string()},
                            cmd_opt);
      if (res.Success()) return true;
      spdlog::warn("uv venv failed ({}); falling back to python -m venv", res.Message());
    } else {
      spdlog::info("uv not found; creating {} with python -m venv", opt_.env_dir.c_str());
    }
  }
  auto res = RunCommand({kPythonExecutable, "-m", "venv", opt_.env_dir.string()}, cmd_opt);
  if (!res.Success()) {
    error = fmt::format("Failed to create environment {}: {}", opt_.env_dir.string(), res.Message());
    return false;
  }
  return true;
}

bool LocalEngine::InstallPackages(std::string& error) {
  fs::path marker = opt_.env_dir / kPackageMarker;
  std::string expected = MarkerContent(packages_);
  {
    std::ifstream fin(marker);
    std::stringstream ss;
    if (fin) ss << fin.rdbuf();
    if (fin && ss.str() == expected) {
      spdlog::debug("Packages of {} already installed", opt_.env_dir.c_str());
      return true;
    }
  }
  spdlog::info("Installing {} into {}", packages_, opt_.env_dir.c_str());
  std::vector<std::string> argv = {InterpreterPath().string(), "-m", "pip", "install"};
  argv.insert(argv.end(), packages_.begin(), packages_.end());
  CommandOptions cmd_opt;
  cmd_opt.timeout_ms = kInstallTimeoutMs;
  cmd_opt.max_output = kCommandOutputLimit;
  auto res = RunCommand(argv, cmd_opt);
  if (!res.Success()) {
    error = fmt::format("Failed to install packages: {}", res.Message());
    return false;
  }
  if (!WriteFile(marker, expected)) {
    error = fmt::format("Failed to write {}", marker.string());
    return false;
  }
  return true;
}

bool LocalEngine::Prepare(std::string& error) {
  std::lock_guard lck(prepare_mtx_);
  if (prepared_) return true;
  if (!CreateDirs(opt_.env_dir.parent_path())) {
    error = fmt::format("Cannot create {}", opt_.env_dir.parent_path().string());
    return false;
  }
  ScopedFileLock lock(opt_.env_dir.string() + ".lock");
  if (!lock.Locked()) {
    error = fmt::format("Cannot lock environment {}", opt_.env_dir.string());
    return false;
  }
  if (!fs::exists(InterpreterPath()) && !CreateEnvironment(error)) return false;
  if (packages_.size() && !InstallPackages(error)) return false;
  prepared_ = true;
  return true;
}

ExecutionOutcome LocalEngine::Execute(const ExecutionRequest& request) {
  std::string error;
  if (!Prepare(error)) {
    spdlog::error("Environment provisioning failed: {}", error);
    return ExecutionOutcome::Failure(error);
  }
  fs::path run_dir = MakeTempDir(opt_.run_root, "run_");
  if (run_dir.empty()) {
    return ExecutionOutcome::Failure(fmt::format("Cannot create a run directory under {}",
                                                 opt_.run_root.string()));
  }
  if (geteuid() == 0 && chown(run_dir.c_str(), opt_.uid, opt_.gid) < 0) {
    spdlog::warn("Failed to chown {}: {}", run_dir.c_str(), strerror(errno));
  }

  WorkerLaunch launch;
  launch.command = {WorkerPath().string(), "--python", InterpreterPath().string()};
  launch.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=" + run_dir.string(), "LANG=C.UTF-8"};
  launch.workdir = run_dir.string();
  launch.uid = opt_.uid;
  launch.gid = opt_.gid;
  ExecutionOutcome ret = RunWorker(launch, request);
  RemoveAll(run_dir);
  return ret;
}
