#ifndef INCLUDE_SNIPBOX_CONTAINER_ENGINE_H_
#define INCLUDE_SNIPBOX_CONTAINER_ENGINE_H_

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "engine.h"
#include "container_runtime.h"

#define ENUM_CONTAINER_STATE_ \
  X(WARM, "warm") \
  X(IN_USE, "in_use") \
  X(EXPIRED, "expired") /* retired on next release or acquire */ \
  X(REMOVED, "removed")
enum class ContainerState {
#define X(name, str) name,
  ENUM_CONTAINER_STATE_
#undef X
};

extern const char kDefaultRuntimeImage[];
extern const char kLocalRuntimeImage[];

// Which daemon to talk to. context excludes host and ssh_host; the other ssh
// fields require ssh_host.
class DockerTarget {
 public:
  std::string context;
  std::string host;
  std::string ssh_host, ssh_user;
  int ssh_port; // 0: default
  std::string ssh_key_path;

  DockerTarget() : ssh_port(0) {}

  // throws ConfigError
  void Validate() const;
  bool IsDefault() const;
  // DOCKER_HOST / DOCKER_SSH_COMMAND, empty if not needed
  std::string DockerHost() const;
  std::string SshCommand() const;
};

class ContainerEngineOptions {
 public:
  std::string image; // explicit image, wins over packages
  std::vector<std::string> packages;
  std::string env_namespace; // salt of the environment hash
  // 0: defaults derived from the policy timeout
  int pool_size;
  int max_runs;
  long ttl_seconds;
  long acquire_timeout_seconds;
  DockerTarget target;
  std::string default_image; // empty: kDefaultRuntimeImage
  // source tree holding docker/runtime/Dockerfile, used as build context; empty: kSourceDir
  std::filesystem::path recipe_dir;

  ContainerEngineOptions() :
      pool_size(0), max_runs(0), ttl_seconds(0), acquire_timeout_seconds(0) {}
};

struct PoolSettings {
  int pool_size;
  int max_runs;
  long ttl_seconds;
  long acquire_timeout_seconds;
};

struct ManagedContainer {
  std::string id, name, image;
  std::string daemon_state, status;
  long created_at; // unix seconds, 0 if unknown
  int run_count; // -1 if not tracked by this process
  ContainerState state;
};

struct CleanupSummary {
  int removed_containers;
  int removed_images;
};

class ContainerEngine : public ExecutionEngine {
  ContainerEngineOptions opt_;
  std::vector<std::string> packages_;
  std::shared_ptr<ContainerRuntime> runtime_;

  ExecutionOutcome RunInContainer(const std::string& name, const ExecutionRequest& request,
                                  bool& discard);
  std::optional<std::string> ResolveBaseImage(std::string& error);
  std::optional<std::string> BuildPackageImage(const std::string& tag, std::string& error);
  // returns the container name; id may be a name, full id or id prefix
  std::string EnsureManaged(const std::string& id);
 public:
  // throws ConfigError
  explicit ContainerEngine(ContainerEngineOptions opt);
  ContainerEngine(ContainerEngineOptions opt, std::shared_ptr<ContainerRuntime> runtime);

  const char* Name() const override { return "container"; }
  ExecutionOutcome Execute(const ExecutionRequest&) override;

  // cached per daemon and environment for the lifetime of the process
  std::optional<std::string> ResolveImage(std::string& error);
  std::string EnvironmentHash() const;
  PoolSettings Settings(long timeout_seconds) const;

  // Administrative operations only ever touch containers carrying the managed label.
  // They throw ContainerError on daemon failures.
  std::vector<ManagedContainer> ListContainers(bool all_states = false);
  std::vector<ImageRecord> ListImages();
  void StopContainer(const std::string& id, long timeout_seconds = 10);
  void KillContainer(const std::string& id);
  CleanupSummary CleanupStale(bool remove_images = false);
  // removes the pooled containers of this engine's daemon
  void Shutdown();
};

#endif  // INCLUDE_SNIPBOX_CONTAINER_ENGINE_H_
