#ifndef INCLUDE_SNIPBOX_LOCAL_ENGINE_H_
#define INCLUDE_SNIPBOX_LOCAL_ENGINE_H_

#include <mutex>
#include <string>
#include <vector>
#include <filesystem>

#include "engine.h"

#define ENUM_ENV_CREATOR_ \
  X(UV, "uv") /* falls back to PYTHON if uv is missing or fails */ \
  X(PYTHON, "python")
enum class EnvCreator {
#define X(name, str) name,
  ENUM_ENV_CREATOR_
#undef X
};

class LocalEngineOptions {
 public:
  std::filesystem::path env_dir;
  EnvCreator creator;
  std::vector<std::string> packages; // name==version only
  // -1: nobody when running as root, the caller otherwise
  int uid, gid;
  std::filesystem::path run_root; // empty: kRunRoot

  LocalEngineOptions() : creator(EnvCreator::UV), uid(-1), gid(-1) {}
};

// Runs the worker as a sandboxed child process on this host, inside a persistent
// virtual environment that is created on first use.
class LocalEngine : public ExecutionEngine {
  LocalEngineOptions opt_;
  std::vector<std::string> packages_;
  std::mutex prepare_mtx_;
  bool prepared_;

  bool CreateEnvironment(std::string& error);
  bool InstallPackages(std::string& error);
 public:
  // throws ConfigError
  explicit LocalEngine(LocalEngineOptions opt);

  const char* Name() const override { return "local"; }
  ExecutionOutcome Execute(const ExecutionRequest&) override;

  // Creates the environment and installs packages; idempotent
  bool Prepare(std::string& error);
  std::filesystem::path InterpreterPath() const;
  const std::vector<std::string>& Packages() const { return packages_; }
};

#endif  // INCLUDE_SNIPBOX_LOCAL_ENGINE_H_
