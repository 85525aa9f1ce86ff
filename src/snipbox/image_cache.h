#ifndef SNIPBOX_IMAGE_CACHE_H_
#define SNIPBOX_IMAGE_CACHE_H_

#include <mutex>
#include <string>
#include <optional>
#include <functional>
#include <unordered_map>

class KeyedMutex {
  std::mutex global_lock_;
  std::unordered_map<std::string, std::mutex> mutex_map_;
 public:
  std::mutex& operator[](const std::string& key);
};

// Process-wide map from (daemon, environment) to a usable image reference
class ImageCache {
  std::mutex mtx_;
  std::unordered_map<std::string, std::string> cache_;
  KeyedMutex resolve_locks_;
 public:
  static ImageCache& Global();

  std::optional<std::string> Lookup(const std::string& key);
  // Concurrent callers with the same key wait for a single resolution.
  // Failures are not cached.
  std::optional<std::string> GetOrResolve(
      const std::string& key, const std::function<std::optional<std::string>()>& resolve);
  void Clear();
};

#endif  // SNIPBOX_IMAGE_CACHE_H_
