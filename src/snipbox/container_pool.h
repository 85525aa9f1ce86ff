#ifndef SNIPBOX_CONTAINER_POOL_H_
#define SNIPBOX_CONTAINER_POOL_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <condition_variable>

#include <snipbox/container_engine.h>

extern const char kCreatedLabel[];

struct ContainerLease {
  std::string name;
  long created_at; // unix seconds
  long last_used_at;
  int run_count;
};

bool ShouldRotate(const ContainerLease&, const PoolSettings&, long now);

// Warm containers per (daemon, image). At most pool_size containers of a key exist
// at any time, counting those being started or removed.
class ContainerPool {
  struct Entry {
    ContainerLease lease;
    bool in_use;
  };
  struct Slot {
    std::string target;
    std::vector<Entry> entries;
    int starting;
    int retiring;
  };
  std::mutex mtx_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Slot> slots_;

  Slot& GetSlot(const std::string& target, const std::string& image);
  void ForgetLocked(const std::string& target, const std::string& name);
  void Retire(ContainerRuntime& runtime, const std::string& target, const std::string& image,
              const std::vector<std::string>& names);
 public:
  static ContainerPool& Global();

  // Blocks until a container is free or can be created, or the acquire timeout passes.
  // spec provides image, memory and labels; the name is generated.
  std::optional<ContainerLease> Acquire(const std::shared_ptr<ContainerRuntime>& runtime,
                                        const ContainerSpec& spec, const PoolSettings& settings,
                                        std::string& error);
  // discard: force-remove regardless of rotation
  void Release(const std::shared_ptr<ContainerRuntime>& runtime, const std::string& image,
               const std::string& name, const PoolSettings& settings, bool discard);

  struct Snapshot {
    ContainerLease lease;
    bool in_use;
  };
  std::unordered_map<std::string, Snapshot> Entries(const std::string& target);
  // drops bookkeeping of a container removed behind the pool's back
  void Forget(const std::string& target, const std::string& name);
  // removes every container of the target, in use or not
  void Shutdown(const std::shared_ptr<ContainerRuntime>& runtime);
};

#endif  // SNIPBOX_CONTAINER_POOL_H_
