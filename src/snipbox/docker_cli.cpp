#include "docker_cli.h"

#include <unistd.h>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

extern char** environ;

namespace {

const long kInfoTimeoutMs = 20'000;
const long kQueryTimeoutMs = 30'000;
const long kPullTimeoutMs = 900'000;
const long kBuildTimeoutMs = 1'800'000;
const long kLifecycleTimeoutMs = 60'000;
// docker exec client overhead on top of the snippet timeout
const long kExecGraceMs = 1'000;
const size_t kExecOutputLimit = 64 << 20;
const size_t kQueryOutputLimit = 16 << 20;

std::vector<std::string> FilterArgs(const Labels& filter) {
  std::vector<std::string> ret;
  for (auto& [key, value] : filter) {
    ret.push_back("--filter");
    ret.push_back(fmt::format("label={}={}", key, value));
  }
  return ret;
}

std::string JsonString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

} // namespace

std::vector<std::string> HardeningFlags(long memory_mb) {
  return {
    "--network", "none",
    "--read-only",
    "--cap-drop", "ALL",
    "--security-opt", "no-new-privileges",
    "--pids-limit", "256",
    "--memory", fmt::format("{}m", std::max(128L, memory_mb)),
    "--tmpfs", "/tmp:rw,noexec,nosuid,size=128m",
  };
}

Labels ParseLabelList(const std::string& str) {
  Labels ret;
  for (auto& i : Split(str, ',')) {
    size_t eq = i.find('=');
    if (i.empty()) continue;
    if (eq == std::string::npos) {
      ret[i] = "";
    } else {
      ret[i.substr(0, eq)] = i.substr(eq + 1);
    }
  }
  return ret;
}

std::string ImageRecord::Ref() const {
  if (repository.empty() || repository == "<none>") return id;
  if (tag.empty() || tag == "<none>") return repository;
  return repository + ":" + tag;
}

DockerCli::DockerCli(const DockerTarget& target) : target_(target) {
  std::string host = target_.DockerHost(), ssh = target_.SshCommand();
  for (char** env = environ; env && *env; env++) {
    std::string entry = *env;
    if (host.size() && entry.rfind("DOCKER_HOST=", 0) == 0) continue;
    if (ssh.size() && entry.rfind("DOCKER_SSH_COMMAND=", 0) == 0) continue;
    env_.push_back(entry);
  }
  if (host.size()) env_.push_back("DOCKER_HOST=" + host);
  if (ssh.size()) env_.push_back("DOCKER_SSH_COMMAND=" + ssh);
}

CommandResult DockerCli::Docker(const std::vector<std::string>& args, long timeout_ms,
                                const std::string& input, size_t max_output) const {
  std::vector<std::string> argv = {"docker"};
  if (target_.context.size()) {
    argv.push_back("--context");
    argv.push_back(target_.context);
  }
  argv.insert(argv.end(), args.begin(), args.end());
  CommandOptions opt;
  opt.env = env_;
  opt.input = input;
  opt.timeout_ms = timeout_ms;
  opt.max_output = max_output ? max_output : kQueryOutputLimit;
  return RunCommand(argv, opt);
}

std::string DockerCli::Target() const {
  if (target_.context.size()) return "context:" + target_.context;
  if (auto host = target_.DockerHost(); host.size()) return "host:" + host;
  return "local";
}

bool DockerCli::Available(std::string& reason) {
  if (!CommandExists("docker")) {
    reason = "Docker CLI was not found. Install Docker and make sure it is on PATH.";
    return false;
  }
  auto res = Docker({"info", "--format", "{{.ServerVersion}}"}, kInfoTimeoutMs);
  if (!res.Success()) {
    reason = fmt::format("Docker daemon at {} is not reachable: {}", Target(), res.Message());
    return false;
  }
  return true;
}

bool DockerCli::ImageExists(const std::string& ref) {
  return Docker({"image", "inspect", ref}, kQueryTimeoutMs).Success();
}

bool DockerCli::PullImage(const std::string& ref) {
  spdlog::info("Pulling image {}", ref);
  auto res = Docker({"pull", ref}, kPullTimeoutMs);
  if (!res.Success()) spdlog::info("Pull of {} failed: {}", ref, res.Message());
  return res.Success();
}

bool DockerCli::BuildImage(const std::string& tag, const std::filesystem::path& recipe,
                           const std::filesystem::path& context, const Labels& labels,
                           std::string& error) {
  spdlog::info("Building image {} from {}", tag, recipe.c_str());
  std::vector<std::string> args = {"build", "-t", tag, "-f", recipe.string()};
  for (auto& [key, value] : labels) {
    args.push_back("--label");
    args.push_back(key + "=" + value);
  }
  args.push_back(context.string());
  auto res = Docker(args, kBuildTimeoutMs);
  if (!res.Success()) {
    error = fmt::format("Failed to build image {}: {}", tag, res.Message());
    return false;
  }
  return true;
}

bool DockerCli::RemoveImage(const std::string& ref) {
  auto res = Docker({"image", "rm", ref}, kLifecycleTimeoutMs);
  if (!res.Success()) spdlog::warn("Failed to remove image {}: {}", ref, res.Message());
  return res.Success();
}

std::optional<std::vector<ImageRecord>> DockerCli::ListImages(const Labels& filter,
                                                             std::string& error) {
  std::vector<std::string> args = {"image", "ls", "--no-trunc"};
  auto filters = FilterArgs(filter);
  args.insert(args.end(), filters.begin(), filters.end());
  args.insert(args.end(), {"--format", "{{json .}}"});
  auto res = Docker(args, kQueryTimeoutMs);
  if (!res.Success()) {
    error = res.Message();
    return std::nullopt;
  }
  std::vector<ImageRecord> ret;
  for (auto& line : Split(res.out, '\n')) {
    if (Trim(line).empty()) continue;
    auto obj = nlohmann::json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) continue;
    ret.push_back({JsonString(obj, "ID"), JsonString(obj, "Repository"), JsonString(obj, "Tag"),
                   JsonString(obj, "CreatedSince"), JsonString(obj, "Size")});
  }
  return ret;
}

bool DockerCli::StartContainer(const ContainerSpec& spec, std::string& error) {
  std::vector<std::string> args = {"run", "-d", "--rm", "--name", spec.name};
  auto flags = HardeningFlags(spec.memory_mb);
  args.insert(args.end(), flags.begin(), flags.end());
  for (auto& [key, value] : spec.labels) {
    args.push_back("--label");
    args.push_back(key + "=" + value);
  }
  args.insert(args.end(), {spec.image, "sleep", "infinity"});
  auto res = Docker(args, kLifecycleTimeoutMs);
  if (!res.Success()) {
    error = res.Message();
    return false;
  }
  return true;
}

bool DockerCli::IsRunning(const std::string& name) {
  auto res = Docker({"inspect", "-f", "{{.State.Running}}", name}, kQueryTimeoutMs);
  return res.Success() && Trim(res.out) == "true";
}

bool DockerCli::RemoveContainer(const std::string& name) {
  return Docker({"rm", "-f", name}, kLifecycleTimeoutMs).Success();
}

bool DockerCli::StopContainer(const std::string& id, long timeout_seconds, std::string& error) {
  auto res = Docker({"stop", "-t", std::to_string(timeout_seconds), id},
                    timeout_seconds * 1000 + kLifecycleTimeoutMs);
  if (!res.Success()) error = res.Message();
  return res.Success();
}

bool DockerCli::KillContainer(const std::string& id, std::string& error) {
  auto res = Docker({"kill", id}, kLifecycleTimeoutMs);
  if (!res.Success()) error = res.Message();
  return res.Success();
}

std::optional<Labels> DockerCli::ContainerLabels(const std::string& id) {
  auto res = Docker({"inspect", "-f", "{{json .Config.Labels}}", id}, kQueryTimeoutMs);
  if (!res.Success()) return std::nullopt;
  auto obj = nlohmann::json::parse(res.out, nullptr, false);
  Labels ret;
  if (!obj.is_object()) return ret;
  for (auto& [key, value] : obj.items()) {
    if (value.is_string()) ret[key] = value.get<std::string>();
  }
  return ret;
}

std::optional<std::vector<ContainerRecord>> DockerCli::ListContainers(
    const Labels& filter, bool all_states, std::string& error) {
  std::vector<std::string> args = {"ps", "--no-trunc"};
  if (all_states) args.push_back("-a");
  auto filters = FilterArgs(filter);
  args.insert(args.end(), filters.begin(), filters.end());
  args.insert(args.end(), {"--format", "{{json .}}"});
  auto res = Docker(args, kQueryTimeoutMs);
  if (!res.Success()) {
    error = res.Message();
    return std::nullopt;
  }
  std::vector<ContainerRecord> ret;
  for (auto& line : Split(res.out, '\n')) {
    if (Trim(line).empty()) continue;
    auto obj = nlohmann::json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) continue;
    ContainerRecord rec;
    rec.id = JsonString(obj, "ID");
    rec.name = JsonString(obj, "Names");
    rec.image = JsonString(obj, "Image");
    rec.state = JsonString(obj, "State");
    rec.status = JsonString(obj, "Status");
    rec.labels = ParseLabelList(JsonString(obj, "Labels"));
    ret.push_back(std::move(rec));
  }
  return ret;
}

CommandResult DockerCli::Exec(const std::string& name, const std::vector<std::string>& argv,
                              const std::string& workdir, const std::string& input,
                              long timeout_seconds) {
  std::vector<std::string> args = {"exec", "-i", "-w", workdir, name};
  args.insert(args.end(), argv.begin(), argv.end());
  return Docker(args, timeout_seconds * 1000 + kExecGraceMs, input, kExecOutputLimit);
}
