#include "fake_runtime.h"

#include <atomic>
#include <algorithm>
#include <thread>

#include <fmt/format.h>

namespace {

std::atomic_int instance_seq = 0;

bool Matches(const Labels& labels, const Labels& filter) {
  for (auto& [key, value] : filter) {
    auto it = labels.find(key);
    if (it == labels.end() || it->second != value) return false;
  }
  return true;
}

} // namespace

FakeRuntime::FakeRuntime() :
    target_(fmt::format("fake:{}", ++instance_seq)),
    active_execs_(0), max_active_execs_(0), builds_(0), started_(0), exec_delay_ms_(0),
    build_delay_ms_(0),
    available(true), pull_succeeds(true) {}

bool FakeRuntime::Available(std::string& reason) {
  if (!available) reason = "Cannot connect to the fake daemon";
  return available;
}

bool FakeRuntime::ImageExists(const std::string& ref) {
  std::lock_guard lck(mtx_);
  return images_.count(ref);
}

bool FakeRuntime::PullImage(const std::string& ref) {
  if (!pull_succeeds) return false;
  std::lock_guard lck(mtx_);
  images_.insert(ref);
  return true;
}

bool FakeRuntime::BuildImage(const std::string& tag, const std::filesystem::path& recipe,
                             const std::filesystem::path&, const Labels&, std::string& error) {
  if (!std::filesystem::exists(recipe)) {
    error = "recipe not found: " + recipe.string();
    return false;
  }
  long delay;
  {
    std::lock_guard lck(mtx_);
    delay = build_delay_ms_;
  }
  if (delay) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  std::lock_guard lck(mtx_);
  builds_++;
  images_.insert(tag);
  return true;
}

bool FakeRuntime::RemoveImage(const std::string& ref) {
  std::lock_guard lck(mtx_);
  return images_.erase(ref);
}

std::optional<std::vector<ImageRecord>> FakeRuntime::ListImages(const Labels&, std::string&) {
  std::lock_guard lck(mtx_);
  std::vector<ImageRecord> ret;
  for (auto& ref : images_) {
    ImageRecord rec;
    rec.id = ref;
    size_t pos = ref.rfind(':');
    rec.repository = ref.substr(0, pos);
    rec.tag = pos == std::string::npos ? "latest" : ref.substr(pos + 1);
    ret.push_back(rec);
  }
  return ret;
}

bool FakeRuntime::StartContainer(const ContainerSpec& spec, std::string& error) {
  std::lock_guard lck(mtx_);
  if (!images_.count(spec.image)) {
    error = "no such image: " + spec.image;
    return false;
  }
  if (containers_.count(spec.name)) {
    error = "name in use: " + spec.name;
    return false;
  }
  containers_[spec.name] = {"id-" + spec.name, spec.image, spec.labels, true};
  started_++;
  return true;
}

std::map<std::string, FakeRuntime::Container>::iterator FakeRuntime::FindLocked(
    const std::string& id) {
  auto it = containers_.find(id);
  if (it != containers_.end()) return it;
  return std::find_if(containers_.begin(), containers_.end(),
                      [&](auto& x) { return x.second.id == id; });
}

bool FakeRuntime::IsRunning(const std::string& name) {
  std::lock_guard lck(mtx_);
  auto it = FindLocked(name);
  return it != containers_.end() && it->second.running;
}

bool FakeRuntime::RemoveContainer(const std::string& name) {
  std::lock_guard lck(mtx_);
  auto it = FindLocked(name);
  if (it == containers_.end()) return false;
  containers_.erase(it);
  return true;
}

bool FakeRuntime::StopContainer(const std::string& id, long, std::string& error) {
  std::lock_guard lck(mtx_);
  auto it = FindLocked(id);
  if (it == containers_.end()) {
    error = "no such container: " + id;
    return false;
  }
  it->second.running = false;
  return true;
}

bool FakeRuntime::KillContainer(const std::string& id, std::string& error) {
  return StopContainer(id, 0, error);
}

std::optional<Labels> FakeRuntime::ContainerLabels(const std::string& id) {
  std::lock_guard lck(mtx_);
  auto it = FindLocked(id);
  if (it == containers_.end()) return std::nullopt;
  return it->second.labels;
}

std::optional<std::vector<ContainerRecord>> FakeRuntime::ListContainers(
    const Labels& filter, bool all_states, std::string&) {
  std::lock_guard lck(mtx_);
  std::vector<ContainerRecord> ret;
  for (auto& [name, item] : containers_) {
    if (!Matches(item.labels, filter)) continue;
    if (!all_states && !item.running) continue;
    ContainerRecord rec;
    rec.id = item.id;
    rec.name = name;
    rec.image = item.image;
    rec.state = item.running ? "running" : "exited";
    rec.status = item.running ? "Up" : "Exited (137)";
    rec.labels = item.labels;
    ret.push_back(std::move(rec));
  }
  return ret;
}

CommandResult FakeRuntime::Exec(const std::string& name, const std::vector<std::string>& argv,
                                const std::string&, const std::string& input, long) {
  ExecHandler handler;
  long delay;
  {
    std::lock_guard lck(mtx_);
    auto it = containers_.find(name);
    if (it == containers_.end() || !it->second.running) {
      CommandResult ret;
      ret.exit_code = 1;
      ret.err = "container not running: " + name;
      return ret;
    }
    max_active_execs_ = std::max(max_active_execs_, ++active_execs_);
    handler = handler_;
    delay = exec_delay_ms_;
  }
  CommandResult ret;
  ret.exit_code = 0;
  // the workspace preparation step runs through sh
  if (argv.size() && argv[0] != "sh") {
    if (delay) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    if (handler) ret = handler(name, argv, input);
  }
  std::lock_guard lck(mtx_);
  active_execs_--;
  return ret;
}

void FakeRuntime::SetExecHandler(ExecHandler handler) {
  std::lock_guard lck(mtx_);
  handler_ = std::move(handler);
}

void FakeRuntime::SetExecDelay(long ms) {
  std::lock_guard lck(mtx_);
  exec_delay_ms_ = ms;
}

void FakeRuntime::SetBuildDelay(long ms) {
  std::lock_guard lck(mtx_);
  build_delay_ms_ = ms;
}

std::string FakeRuntime::ContainerId(const std::string& name) const {
  std::lock_guard lck(mtx_);
  auto it = containers_.find(name);
  return it == containers_.end() ? "" : it->second.id;
}

void FakeRuntime::AddImage(const std::string& ref) {
  std::lock_guard lck(mtx_);
  images_.insert(ref);
}

void FakeRuntime::AddContainer(const std::string& name, const Labels& labels, bool running) {
  std::lock_guard lck(mtx_);
  containers_[name] = {"id-" + name, "busybox", labels, running};
}

int FakeRuntime::Builds() const {
  std::lock_guard lck(mtx_);
  return builds_;
}

int FakeRuntime::Started() const {
  std::lock_guard lck(mtx_);
  return started_;
}

int FakeRuntime::MaxActiveExecs() const {
  std::lock_guard lck(mtx_);
  return max_active_execs_;
}

std::vector<std::string> FakeRuntime::ContainerNames() const {
  std::lock_guard lck(mtx_);
  std::vector<std::string> ret;
  for (auto& [name, item] : containers_) ret.push_back(name);
  return ret;
}
