#ifndef INCLUDE_SNIPBOX_CONTAINER_RUNTIME_H_
#define INCLUDE_SNIPBOX_CONTAINER_RUNTIME_H_

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "process.h"

using Labels = std::map<std::string, std::string>;

struct ContainerRecord {
  std::string id, name, image;
  std::string state; // as reported by the daemon (running, exited, ...)
  std::string status;
  Labels labels;

  bool Running() const { return state == "running"; }
};

struct ImageRecord {
  std::string id, repository, tag;
  std::string created_since, size;

  std::string Ref() const;
};

struct ContainerSpec {
  std::string name, image;
  long memory_mb;
  Labels labels;

  ContainerSpec() : memory_mb(0) {}
};

// Operations on one container daemon. The hardening of created containers is
// the implementation's business and cannot be relaxed by callers.
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  // identifies the daemon; pool and image cache entries are keyed on it
  virtual std::string Target() const = 0;
  virtual bool Available(std::string& reason) = 0;

  virtual bool ImageExists(const std::string& ref) = 0;
  virtual bool PullImage(const std::string& ref) = 0;
  virtual bool BuildImage(const std::string& tag, const std::filesystem::path& recipe,
                          const std::filesystem::path& context, const Labels& labels,
                          std::string& error) = 0;
  virtual bool RemoveImage(const std::string& ref) = 0;
  virtual std::optional<std::vector<ImageRecord>> ListImages(
      const Labels& filter, std::string& error) = 0;

  virtual bool StartContainer(const ContainerSpec& spec, std::string& error) = 0;
  virtual bool IsRunning(const std::string& name) = 0;
  // forced; the container is gone afterwards
  virtual bool RemoveContainer(const std::string& name) = 0;
  virtual bool StopContainer(const std::string& id, long timeout_seconds, std::string& error) = 0;
  virtual bool KillContainer(const std::string& id, std::string& error) = 0;
  // nullopt if the container does not exist
  virtual std::optional<Labels> ContainerLabels(const std::string& id) = 0;
  virtual std::optional<std::vector<ContainerRecord>> ListContainers(
      const Labels& filter, bool all_states, std::string& error) = 0;

  virtual CommandResult Exec(const std::string& name, const std::vector<std::string>& argv,
                             const std::string& workdir, const std::string& input,
                             long timeout_seconds) = 0;
};

#endif  // INCLUDE_SNIPBOX_CONTAINER_RUNTIME_H_
