#ifndef CONTAINER_CLI_RUNTIME_HPP
#define CONTAINER_CLI_RUNTIME_HPP

#include <string>
#include <vector>

#include "container/runtime.hpp"
#include "util/subprocess.hpp"

namespace container {

// Runtime that drives a docker-compatible command line client. Every command
// is run with a wall limit, so that a hung daemon cannot block the caller
// forever.
class CliRuntime : public ContainerRuntime {
 public:
  CliRuntime(std::string executable, const core::Config& config)
      : executable_(std::move(executable)),
        temp_directory_(config.temp_directory),
        command_timeout_millis_(config.command_timeout_millis),
        pull_timeout_millis_(config.pull_timeout_millis) {}

  std::string Name() const override { return executable_; }

  bool HasImage(const std::string& image) override;
  bool PullImage(const std::string& image, std::string* error_msg) override;
  bool CreateContainer(const ContainerConfig& config, std::string* id,
                       std::string* error_msg) override;
  bool StartContainer(const std::string& id, std::string* error_msg) override;
  bool InspectContainer(const std::string& id, int64_t timeout_millis,
                        ContainerState* state, std::string* error_msg) override;
  bool ContainerLogs(const std::string& id, int64_t max_bytes,
                     std::string* logs, std::string* error_msg) override;
  bool StopContainer(const std::string& id, int32_t grace_seconds,
                     std::string* error_msg) override;
  bool RemoveContainer(const std::string& id, std::string* error_msg) override;

  // Arguments of the create command for the given configuration.
  static std::vector<std::string> CreateArgs(const ContainerConfig& config);

  // Parses the output of inspect with kInspectFormat.
  static bool ParseState(const std::string& text, ContainerState* state,
                         std::string* error_msg);
  static const constexpr char* kInspectFormat =
      "{{.State.Status}} {{.State.ExitCode}}";

 protected:
  // Scores an implementation that uses the given client.
  static int ScoreExecutable(const std::string& executable, int score);

 private:
  // Options to run the client with the given arguments.
  util::SubprocessOptions Options(const std::vector<std::string>& args,
                                  int64_t timeout_millis) const;

  // Runs the client. Returns false and sets error_msg if the client could not
  // be run or reported a failure.
  bool Command(const util::SubprocessOptions& options,
               util::CommandOutput* output, std::string* error_msg);

  std::string executable_;
  std::string temp_directory_;
  int64_t command_timeout_millis_;
  int64_t pull_timeout_millis_;
};

class DockerRuntime : public CliRuntime {
 public:
  static const constexpr char* kName = "docker";
  explicit DockerRuntime(const core::Config& config)
      : CliRuntime(kName, config) {}
  static ContainerRuntime* Create(const core::Config& config) {
    return new DockerRuntime(config);
  }
  static int Score() { return ScoreExecutable(kName, 2); }
};

class PodmanRuntime : public CliRuntime {
 public:
  static const constexpr char* kName = "podman";
  explicit PodmanRuntime(const core::Config& config)
      : CliRuntime(kName, config) {}
  static ContainerRuntime* Create(const core::Config& config) {
    return new PodmanRuntime(config);
  }
  static int Score() { return ScoreExecutable(kName, 1); }
};

}  // namespace container

#endif
