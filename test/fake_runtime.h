#ifndef TEST_FAKE_RUNTIME_H_
#define TEST_FAKE_RUNTIME_H_

#include <set>
#include <mutex>
#include <functional>

#include <snipbox/container_runtime.h>

// In-memory daemon. Each instance has its own Target(), so pool and image cache
// entries never leak between tests.
class FakeRuntime : public ContainerRuntime {
 public:
  struct Container {
    std::string id, image;
    Labels labels;
    bool running;
  };
  using ExecHandler = std::function<CommandResult(const std::string& name,
                                                  const std::vector<std::string>& argv,
                                                  const std::string& input)>;
 private:
  std::string target_;
  mutable std::mutex mtx_;
  std::set<std::string> images_;
  std::map<std::string, Container> containers_;
  ExecHandler handler_;
  int active_execs_;
  int max_active_execs_;
  int builds_;
  int started_;
  long exec_delay_ms_;
  long build_delay_ms_;

  // by name or id
  std::map<std::string, Container>::iterator FindLocked(const std::string& id);
 public:
  bool available;
  bool pull_succeeds;

  FakeRuntime();

  std::string Target() const override { return target_; }
  bool Available(std::string& reason) override;

  bool ImageExists(const std::string& ref) override;
  bool PullImage(const std::string& ref) override;
  bool BuildImage(const std::string& tag, const std::filesystem::path& recipe,
                  const std::filesystem::path& context, const Labels& labels,
                  std::string& error) override;
  bool RemoveImage(const std::string& ref) override;
  std::optional<std::vector<ImageRecord>> ListImages(
      const Labels& filter, std::string& error) override;

  bool StartContainer(const ContainerSpec& spec, std::string& error) override;
  bool IsRunning(const std::string& name) override;
  bool RemoveContainer(const std::string& name) override;
  bool StopContainer(const std::string& id, long timeout_seconds, std::string& error) override;
  bool KillContainer(const std::string& id, std::string& error) override;
  std::optional<Labels> ContainerLabels(const std::string& id) override;
  std::optional<std::vector<ContainerRecord>> ListContainers(
      const Labels& filter, bool all_states, std::string& error) override;

  CommandResult Exec(const std::string& name, const std::vector<std::string>& argv,
                     const std::string& workdir, const std::string& input,
                     long timeout_seconds) override;

  // test controls
  void SetExecHandler(ExecHandler handler);
  void SetExecDelay(long ms);
  void SetBuildDelay(long ms);
  void AddImage(const std::string& ref);
  // a container not created through StartContainer
  void AddContainer(const std::string& name, const Labels& labels, bool running = true);
  int Builds() const;
  int Started() const;
  int MaxActiveExecs() const;
  std::string ContainerId(const std::string& name) const;
  std::vector<std::string> ContainerNames() const;
};

#endif  // TEST_FAKE_RUNTIME_H_
