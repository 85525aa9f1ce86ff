#ifndef SNIPBOX_DOCKER_CLI_H_
#define SNIPBOX_DOCKER_CLI_H_

#include <string>
#include <vector>

#include <snipbox/container_engine.h>
#include <snipbox/container_runtime.h>

// flags every pooled container is created with
std::vector<std::string> HardeningFlags(long memory_mb);
Labels ParseLabelList(const std::string&);

// ContainerRuntime driving the docker command-line client
class DockerCli : public ContainerRuntime {
  DockerTarget target_;
  std::vector<std::string> env_;

  CommandResult Docker(const std::vector<std::string>& args, long timeout_ms,
                       const std::string& input = "", size_t max_output = 0) const;
 public:
  explicit DockerCli(const DockerTarget&);

  std::string Target() const override;
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
};

#endif  // SNIPBOX_DOCKER_CLI_H_
