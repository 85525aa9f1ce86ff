#include "container_pool.h"

#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

const char kCreatedLabel[] = "snipbox.created";

namespace {

std::string SlotKey(const std::string& target, const std::string& image) {
  return target + "|" + image;
}

} // namespace

bool ShouldRotate(const ContainerLease& lease, const PoolSettings& settings, long now) {
  return lease.run_count >= settings.max_runs || now - lease.created_at >= settings.ttl_seconds;
}

ContainerPool& ContainerPool::Global() {
  static ContainerPool pool;
  return pool;
}

ContainerPool::Slot& ContainerPool::GetSlot(const std::string& target, const std::string& image) {
  auto [it, inserted] = slots_.try_emplace(SlotKey(target, image));
  if (inserted) {
    it->second.target = target;
    it->second.starting = it->second.retiring = 0;
  }
  return it->second;
}

void ContainerPool::Retire(ContainerRuntime& runtime, const std::string& target,
                           const std::string& image, const std::vector<std::string>& names) {
  // called without the lock; the retiring count keeps the slots reserved meanwhile
  for (auto& name : names) {
    spdlog::info("Retiring container {}", name);
    if (!runtime.RemoveContainer(name)) spdlog::warn("Failed to remove container {}", name);
  }
  {
    std::lock_guard lck(mtx_);
    GetSlot(target, image).retiring -= names.size();
  }
  cv_.notify_all();
}

std::optional<ContainerLease> ContainerPool::Acquire(
    const std::shared_ptr<ContainerRuntime>& runtime, const ContainerSpec& spec,
    const PoolSettings& settings, std::string& error) {
  const std::string target = runtime->Target();
  const auto deadline = std::chrono::steady_clock::now() +
      std::chrono::seconds(settings.acquire_timeout_seconds);
  std::unique_lock lck(mtx_);
  while (true) {
    Slot& slot = GetSlot(target, spec.image);
    long now = UnixNow();

    std::vector<std::string> retired;
    auto rotated = std::remove_if(slot.entries.begin(), slot.entries.end(), [&](const Entry& x) {
      if (x.in_use || !ShouldRotate(x.lease, settings, now)) return false;
      retired.push_back(x.lease.name);
      return true;
    });
    slot.entries.erase(rotated, slot.entries.end());
    if (retired.size()) {
      slot.retiring += retired.size();
      lck.unlock();
      Retire(*runtime, target, spec.image, retired);
      lck.lock();
      continue;
    }

    auto idle = std::find_if(slot.entries.begin(), slot.entries.end(),
                             [](const Entry& x) { return !x.in_use; });
    if (idle != slot.entries.end()) {
      idle->in_use = true;
      ContainerLease lease = idle->lease;
      lck.unlock();
      if (runtime->IsRunning(lease.name)) {
        spdlog::debug("Reusing container {} (run {})", lease.name, lease.run_count + 1);
        return lease;
      }
      spdlog::info("Pooled container {} is gone; dropping it", lease.name);
      if (!runtime->RemoveContainer(lease.name)) {
        spdlog::debug("Container {} already removed", lease.name);
      }
      lck.lock();
      ForgetLocked(target, lease.name);
      continue;
    }

    if ((int)slot.entries.size() + slot.starting + slot.retiring < settings.pool_size) {
      slot.starting++;
      lck.unlock();
      ContainerSpec create = spec;
      create.name = "snipbox-" + RandomHex(12);
      long created_at = UnixNow();
      create.labels[kCreatedLabel] = std::to_string(created_at);
      std::string start_error;
      bool started = runtime->StartContainer(create, start_error);
      lck.lock();
      Slot& cur = GetSlot(target, spec.image);
      cur.starting--;
      if (!started) {
        cv_.notify_all();
        error = fmt::format("Failed to start container: {}", start_error);
        return std::nullopt;
      }
      spdlog::info("Started container {} from {}", create.name, spec.image);
      ContainerLease lease{create.name, created_at, created_at, 0};
      cur.entries.push_back({lease, true});
      return lease;
    }

    if (cv_.wait_until(lck, deadline) == std::cv_status::timeout) {
      error = fmt::format("Timed out after {}s waiting for a free container",
                          settings.acquire_timeout_seconds);
      return std::nullopt;
    }
  }
}

void ContainerPool::Release(const std::shared_ptr<ContainerRuntime>& runtime,
                            const std::string& image, const std::string& name,
                            const PoolSettings& settings, bool discard) {
  const std::string target = runtime->Target();
  bool remove = false;
  {
    std::lock_guard lck(mtx_);
    Slot& slot = GetSlot(target, image);
    auto it = std::find_if(slot.entries.begin(), slot.entries.end(),
                           [&](const Entry& x) { return x.lease.name == name; });
    if (it != slot.entries.end()) {
      it->in_use = false;
      it->lease.run_count++;
      it->lease.last_used_at = UnixNow();
      if (discard || ShouldRotate(it->lease, settings, it->lease.last_used_at)) {
        slot.entries.erase(it);
        slot.retiring++;
        remove = true;
      }
    }
  }
  if (remove) {
    Retire(*runtime, target, image, {name});
  } else {
    cv_.notify_all();
  }
}

std::unordered_map<std::string, ContainerPool::Snapshot> ContainerPool::Entries(
    const std::string& target) {
  std::lock_guard lck(mtx_);
  std::unordered_map<std::string, Snapshot> ret;
  for (auto& [key, slot] : slots_) {
    if (slot.target != target) continue;
    for (auto& i : slot.entries) ret[i.lease.name] = {i.lease, i.in_use};
  }
  return ret;
}

void ContainerPool::Forget(const std::string& target, const std::string& name) {
  std::lock_guard lck(mtx_);
  ForgetLocked(target, name);
}

void ContainerPool::ForgetLocked(const std::string& target, const std::string& name) {
  for (auto& [key, slot] : slots_) {
    if (slot.target != target) continue;
    auto before = slot.entries.size();
    slot.entries.erase(std::remove_if(slot.entries.begin(), slot.entries.end(),
        [&](const Entry& x) { return x.lease.name == name; }), slot.entries.end());
    if (slot.entries.size() != before) cv_.notify_all();
  }
}

void ContainerPool::Shutdown(const std::shared_ptr<ContainerRuntime>& runtime) {
  const std::string target = runtime->Target();
  std::vector<std::string> names;
  {
    std::lock_guard lck(mtx_);
    for (auto it = slots_.begin(); it != slots_.end();) {
      if (it->second.target != target) {
        ++it;
        continue;
      }
      for (auto& i : it->second.entries) names.push_back(i.lease.name);
      it->second.entries.clear();
      ++it;
    }
  }
  for (auto& name : names) {
    spdlog::info("Removing pooled container {}", name);
    if (!runtime->RemoveContainer(name)) spdlog::warn("Failed to remove container {}", name);
  }
  cv_.notify_all();
}
