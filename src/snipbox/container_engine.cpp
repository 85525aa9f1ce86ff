#include <snipbox/container_engine.h>

#include <atomic>
#include <thread>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <snipbox/errors.h>
#include <snipbox/paths.h>
#include "container_pool.h"
#include "image_cache.h"
#include "docker_cli.h"
#include "packages.h"
#include "utils.h"

const char kDefaultRuntimeImage[] = "ghcr.io/snipbox/runtime:py311";
const char kLocalRuntimeImage[] = "snipbox-runtime:local";

namespace {

const char kManagedLabel[] = "snipbox.managed";
const char kEngineLabel[] = "snipbox.engine";
const char kProjectLabel[] = "snipbox.project";
const char kEnvHashLabel[] = "snipbox.env_hash";
const char kPackageImagePrefix[] = "snipbox-env:";

const char kContainerRunRoot[] = "/tmp/snipbox";
const char kContainerWorker[] = "snipbox-worker";
const char kContainerPython[] = "/opt/snipbox/venv/bin/python";
const char kContainerPip[] = "/opt/snipbox/venv/bin/pip";

const int kDefaultMaxRuns = 25;
const long kDefaultTtl = 600;
const long kAcquireSlack = 2;
const int kMaxDefaultPoolSize = 4;
const long kPrepareTimeout = 30;
// docker exec reports a SIGKILLed process this way; cgroup OOM kills look like it
const int kExitKilled = 137;

std::atomic_long run_seq = 0;

bool IsManaged(const Labels& labels) {
  auto it = labels.find(kManagedLabel);
  return it != labels.end() && it->second == "true";
}

long ParseCreated(const Labels& labels) {
  auto it = labels.find(kCreatedLabel);
  if (it == labels.end()) return 0;
  try {
    return std::stol(it->second);
  } catch (const std::logic_error&) {
    return 0;
  }
}

ContainerEngineOptions Validated(ContainerEngineOptions opt) {
  opt.target.Validate();
  if (opt.pool_size < 0 || opt.max_runs < 0 || opt.ttl_seconds < 0 ||
      opt.acquire_timeout_seconds < 0) {
    throw ConfigError("pool_size, max_runs, ttl_seconds and acquire_timeout_seconds "
                      "must not be negative");
  }
  if (opt.default_image.empty()) opt.default_image = kDefaultRuntimeImage;
  if (opt.recipe_dir.empty()) opt.recipe_dir = kSourceDir;
  return opt;
}

} // namespace

void DockerTarget::Validate() const {
  if (context.size() && (host.size() || ssh_host.size())) {
    throw ConfigError("docker_context cannot be combined with docker_host or ssh_host");
  }
  if (host.size() && ssh_host.size()) {
    throw ConfigError("docker_host cannot be combined with ssh_host");
  }
  if (ssh_host.empty() && (ssh_user.size() || ssh_port || ssh_key_path.size())) {
    throw ConfigError("ssh_user, ssh_port and ssh_key_path require ssh_host");
  }
  if (ssh_port < 0 || ssh_port > 65535) throw ConfigError("ssh_port must be within 1-65535");
}

bool DockerTarget::IsDefault() const {
  return context.empty() && host.empty() && ssh_host.empty();
}

std::string DockerTarget::DockerHost() const {
  if (host.size()) return host;
  if (ssh_host.empty()) return "";
  return ssh_user.size() ? fmt::format("ssh://{}@{}", ssh_user, ssh_host) : "ssh://" + ssh_host;
}

std::string DockerTarget::SshCommand() const {
  if (ssh_host.empty() || (!ssh_port && ssh_key_path.empty())) return "";
  std::string ret = "ssh";
  if (ssh_port) ret += fmt::format(" -p {}", ssh_port);
  if (ssh_key_path.size()) {
    // docker splits DOCKER_SSH_COMMAND with shell rules
    std::string quoted = "'";
    for (char c : ssh_key_path) {
      if (c == '\'') {
        quoted += "'\\''";
      } else {
        quoted += c;
      }
    }
    ret += " -i " + quoted + "'";
  }
  return ret;
}

ContainerEngine::ContainerEngine(ContainerEngineOptions opt) :
    ContainerEngine(std::move(opt), nullptr) {}

ContainerEngine::ContainerEngine(ContainerEngineOptions opt,
                                 std::shared_ptr<ContainerRuntime> runtime) :
    opt_(Validated(std::move(opt))),
    packages_(NormalizePinnedPackages(opt_.packages)),
    runtime_(runtime ? std::move(runtime) : std::make_shared<DockerCli>(opt_.target)) {}

PoolSettings ContainerEngine::Settings(long timeout_seconds) const {
  PoolSettings ret;
  int cpus = std::max(1u, std::thread::hardware_concurrency());
  ret.pool_size = opt_.pool_size ? opt_.pool_size : std::min(cpus, kMaxDefaultPoolSize);
  ret.max_runs = opt_.max_runs ? opt_.max_runs : kDefaultMaxRuns;
  ret.ttl_seconds = opt_.ttl_seconds ? opt_.ttl_seconds : kDefaultTtl;
  ret.acquire_timeout_seconds = opt_.acquire_timeout_seconds ?
      opt_.acquire_timeout_seconds : timeout_seconds + kAcquireSlack;
  return ret;
}

std::string ContainerEngine::EnvironmentHash() const {
  return ::EnvironmentHash(kPythonVersion, opt_.env_namespace, packages_);
}

std::optional<std::string> ContainerEngine::ResolveBaseImage(std::string& error) {
  if (runtime_->ImageExists(opt_.default_image) || runtime_->PullImage(opt_.default_image)) {
    return opt_.default_image;
  }
  spdlog::warn("Default image {} is unavailable; using local build {}",
               opt_.default_image, kLocalRuntimeImage);
  if (runtime_->ImageExists(kLocalRuntimeImage)) return kLocalRuntimeImage;
  Labels labels = {
    {kManagedLabel, "true"}, {kEngineLabel, "docker"}, {kProjectLabel, "snipbox"},
  };
  std::string build_error;
  if (!runtime_->BuildImage(kLocalRuntimeImage, RuntimeRecipePath(opt_.recipe_dir),
                            opt_.recipe_dir, labels, build_error)) {
    error = build_error;
    return std::nullopt;
  }
  return kLocalRuntimeImage;
}

std::optional<std::string> ContainerEngine::BuildPackageImage(const std::string& tag,
                                                              std::string& error) {
  auto base = ResolveBaseImage(error);
  if (!base) return std::nullopt;
  fs::path context = MakeTempDir(fs::temp_directory_path(), "snipbox-build-");
  if (context.empty()) {
    error = "Cannot create a build context directory";
    return std::nullopt;
  }
  std::string hash = EnvironmentHash();
  Labels labels = {
    {kManagedLabel, "true"}, {kEngineLabel, "docker"}, {kProjectLabel, "snipbox"},
    {kEnvHashLabel, hash},
  };
  std::string recipe = fmt::format("FROM {}\n", *base);
  for (auto& [key, value] : labels) recipe += fmt::format("LABEL {}=\"{}\"\n", key, value);
  recipe += fmt::format("RUN {} install --no-cache-dir {}\n", kContainerPip,
                        fmt::join(packages_, " "));
  std::optional<std::string> ret;
  if (!WriteFile(context / "Dockerfile", recipe)) {
    error = "Cannot write the package image recipe";
  } else if (runtime_->BuildImage(tag, context / "Dockerfile", context, labels, error)) {
    ret = tag;
  }
  RemoveAll(context);
  return ret;
}

std::optional<std::string> ContainerEngine::ResolveImage(std::string& error) {
  std::string key = runtime_->Target() + "|" +
      (opt_.image.size() ? "image:" + opt_.image : "env:" + EnvironmentHash());
  return ImageCache::Global().GetOrResolve(key, [&]() -> std::optional<std::string> {
    if (opt_.image.size()) {
      if (runtime_->ImageExists(opt_.image) || runtime_->PullImage(opt_.image)) return opt_.image;
      error = fmt::format("Image {} is neither present nor pullable", opt_.image);
      return std::nullopt;
    }
    if (packages_.size()) {
      std::string tag = kPackageImagePrefix + EnvironmentHash();
      if (runtime_->ImageExists(tag)) return tag;
      return BuildPackageImage(tag, error);
    }
    return ResolveBaseImage(error);
  });
}

ExecutionOutcome ContainerEngine::Execute(const ExecutionRequest& request) {
  std::string error;
  if (!runtime_->Available(error)) {
    spdlog::warn("Container runtime unavailable: {}", error);
    return ExecutionOutcome::Failure(error);
  }
  auto image = ResolveImage(error);
  if (!image) {
    spdlog::error("No runtime image: {}", error);
    return ExecutionOutcome::Failure(error);
  }
  PoolSettings settings = Settings(request.policy.timeout_seconds);
  ContainerSpec spec;
  spec.image = *image;
  spec.memory_mb = request.policy.memory_limit_mb;
  spec.labels = {
    {kManagedLabel, "true"}, {kEngineLabel, "docker"}, {kProjectLabel, "snipbox"},
    {kEnvHashLabel, EnvironmentHash()},
  };
  auto lease = ContainerPool::Global().Acquire(runtime_, spec, settings, error);
  if (!lease) {
    spdlog::warn("No container available: {}", error);
    return ExecutionOutcome::Failure(error);
  }
  bool discard = false;
  ExecutionOutcome ret = RunInContainer(lease->name, request, discard);
  ContainerPool::Global().Release(runtime_, *image, lease->name, settings, discard);
  return ret;
}

ExecutionOutcome ContainerEngine::RunInContainer(const std::string& name,
                                                 const ExecutionRequest& request, bool& discard) {
  std::string workdir = fmt::format("{}/run_{}", kContainerRunRoot, ++run_seq);
  auto prep = runtime_->Exec(name, {"sh", "-c", fmt::format("rm -rf {} && mkdir -p {}",
                                                          kContainerRunRoot, workdir)},
                             "/", "", kPrepareTimeout);
  if (!prep.Success()) {
    discard = true;
    return ExecutionOutcome::Failure(
        fmt::format("Failed to prepare container workspace: {}", prep.Message()));
  }
  auto res = runtime_->Exec(name, {kContainerWorker, "--python", kContainerPython}, workdir,
                            request.SerializedPayload(), request.policy.timeout_seconds);
  ExecutionOutcome ret;
  if (res.timed_out) {
    // the process inside keeps running until the container goes away
    discard = true;
    ret.timed_out = true;
    return ret;
  }
  if (res.spawn_failed) {
    discard = true;
    return ExecutionOutcome::Failure(fmt::format("Failed to run docker exec: {}", res.Message()));
  }
  ret.response = std::move(res.out);
  ret.diagnostics = std::move(res.err);
  if (res.term_signal) {
    ret.term_signal = res.term_signal;
  } else {
    ret.exit_code = res.exit_code;
  }
  if (res.exit_code == kExitKilled && Trim(ret.response).empty()) ret.resource_exceeded = true;
  return ret;
}

std::string ContainerEngine::EnsureManaged(const std::string& id) {
  auto labels = runtime_->ContainerLabels(id);
  if (!labels) throw ContainerError(fmt::format("Container {} does not exist", id));
  if (!IsManaged(*labels)) {
    throw ContainerError(fmt::format("Container {} is not managed by snipbox", id));
  }
  // pool leases are keyed by name
  std::string error;
  auto records = runtime_->ListContainers({{kManagedLabel, "true"}}, true, error);
  if (!records) {
    spdlog::warn("Failed to resolve name of container {}: {}", id, error);
    return id;
  }
  for (auto& rec : *records) {
    if (rec.name == id || rec.id.rfind(id, 0) == 0) return rec.name;
  }
  return id;
}

std::vector<ManagedContainer> ContainerEngine::ListContainers(bool all_states) {
  std::string error;
  auto records = runtime_->ListContainers({{kManagedLabel, "true"}}, all_states, error);
  if (!records) throw ContainerError(fmt::format("Failed to list containers: {}", error));
  auto leases = ContainerPool::Global().Entries(runtime_->Target());
  PoolSettings settings = Settings(Policy().timeout_seconds);
  long now = UnixNow();
  std::vector<ManagedContainer> ret;
  for (auto& rec : *records) {
    if (!IsManaged(rec.labels)) continue;
    ManagedContainer item;
    item.id = rec.id;
    item.name = rec.name;
    item.image = rec.image;
    item.daemon_state = rec.state;
    item.status = rec.status;
    item.created_at = ParseCreated(rec.labels);
    item.run_count = -1;
    item.state = ContainerState::WARM;
    if (auto it = leases.find(rec.name); it != leases.end()) {
      item.run_count = it->second.lease.run_count;
      if (it->second.in_use) item.state = ContainerState::IN_USE;
      if (item.run_count >= settings.max_runs) item.state = ContainerState::EXPIRED;
    }
    if (item.created_at && now - item.created_at >= settings.ttl_seconds) {
      item.state = ContainerState::EXPIRED;
    }
    if (!rec.Running()) item.state = rec.state == "removing" ?
        ContainerState::REMOVED : ContainerState::EXPIRED;
    ret.push_back(std::move(item));
  }
  return ret;
}

std::vector<ImageRecord> ContainerEngine::ListImages() {
  std::string error;
  auto images = runtime_->ListImages({{kManagedLabel, "true"}}, error);
  if (!images) throw ContainerError(fmt::format("Failed to list images: {}", error));
  return *images;
}

void ContainerEngine::StopContainer(const std::string& id, long timeout_seconds) {
  std::string name = EnsureManaged(id);
  std::string error;
  if (!runtime_->StopContainer(id, timeout_seconds, error)) {
    throw ContainerError(fmt::format("Failed to stop container {}: {}", id, error));
  }
  ContainerPool::Global().Forget(runtime_->Target(), name);
}

void ContainerEngine::KillContainer(const std::string& id) {
  std::string name = EnsureManaged(id);
  std::string error;
  if (!runtime_->KillContainer(id, error)) {
    throw ContainerError(fmt::format("Failed to kill container {}: {}", id, error));
  }
  ContainerPool::Global().Forget(runtime_->Target(), name);
}

CleanupSummary ContainerEngine::CleanupStale(bool remove_images) {
  CleanupSummary ret = {0, 0};
  for (auto& item : ListContainers(true)) {
    if (item.state != ContainerState::EXPIRED && item.state != ContainerState::REMOVED) continue;
    spdlog::info("Removing stale container {} ({})", item.name, item.status);
    if (runtime_->RemoveContainer(item.id)) {
      ret.removed_containers++;
      ContainerPool::Global().Forget(runtime_->Target(), item.name);
    } else {
      spdlog::warn("Failed to remove container {}", item.name);
    }
  }
  if (remove_images) {
    for (auto& image : ListImages()) {
      if (runtime_->RemoveImage(image.Ref())) ret.removed_images++;
    }
    ImageCache::Global().Clear();
  }
  return ret;
}

void ContainerEngine::Shutdown() {
  ContainerPool::Global().Shutdown(runtime_);
}
