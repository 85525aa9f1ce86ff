#include "image_cache.h"

#include <spdlog/spdlog.h>

std::mutex& KeyedMutex::operator[](const std::string& key) {
  std::lock_guard<std::mutex> lck(global_lock_);
  return mutex_map_[key];
}

ImageCache& ImageCache::Global() {
  static ImageCache cache;
  return cache;
}

std::optional<std::string> ImageCache::Lookup(const std::string& key) {
  std::lock_guard lck(mtx_);
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> ImageCache::GetOrResolve(
    const std::string& key, const std::function<std::optional<std::string>()>& resolve) {
  if (auto ret = Lookup(key)) return ret;
  std::lock_guard resolve_lck(resolve_locks_[key]);
  if (auto ret = Lookup(key)) return ret;
  spdlog::debug("Resolving image for {}", key);
  auto ret = resolve();
  if (ret) {
    std::lock_guard lck(mtx_);
    cache_[key] = *ret;
  }
  return ret;
}

void ImageCache::Clear() {
  std::lock_guard lck(mtx_);
  cache_.clear();
}
