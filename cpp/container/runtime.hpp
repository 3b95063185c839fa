#ifndef CONTAINER_RUNTIME_HPP
#define CONTAINER_RUNTIME_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "core/config.hpp"

namespace container {

struct Mount {
  std::string source;
  std::string target;
  bool read_only = true;
};

// Everything needed to create a container.
struct ContainerConfig {
  std::string image;
  std::vector<std::string> command;
  std::string working_dir;
  std::vector<Mount> mounts;

  // Writable tmpfs; not mounted if scratch_path is empty.
  std::string scratch_path;
  int64_t scratch_size_bytes = 0;

  // Limits. Zero means no limit.
  int64_t memory_bytes = 0;
  int64_t memory_swap_bytes = 0;
  int64_t cpu_period_micros = 0;
  int64_t cpu_quota_micros = 0;
  int32_t pids_limit = 0;

  bool network_disabled = false;
  bool read_only_root = false;
};

// Builds the configuration of a container that runs command under policy.
ContainerConfig ConfigFromPolicy(const core::ResourceLimitPolicy& policy,
                                 const std::string& image,
                                 std::vector<std::string> command);

struct ContainerState {
  bool running = false;
  bool exited = false;
  int32_t exit_code = 0;
  // Status as reported by the runtime, e.g. "created", "running", "exited".
  std::string status;
};

// Container runtime interface. Implementations need to register themselves by
// creating a global object of type ContainerRuntime::Register<RuntimeImpl> and
// should define a kName constant and the Create and Score static functions.
// Create should return a pointer to a newly allocated instance of the given
// implementation, while Score should return a value that defines how "good"
// that runtime is: negative if the runtime cannot be used on this machine,
// positive otherwise (a bigger value means a better runtime).
// Registering a runtime is not thread-safe and should be done before any
// threads are created.
// All the methods that can fail return false and set error_msg.
class ContainerRuntime {
 public:
  using create_t = std::function<ContainerRuntime*(const core::Config&)>;
  using score_t = std::function<int()>;

  // Returns the runtime named config.runtime, or the best available one if
  // config.runtime is empty. Returns nullptr if no runtime can be used.
  static std::unique_ptr<ContainerRuntime> Create(const core::Config& config);

  virtual std::string Name() const = 0;

  virtual bool HasImage(const std::string& image) = 0;
  virtual bool PullImage(const std::string& image, std::string* error_msg) = 0;

  // Creates a container, without starting it. id may be set even if the
  // creation fails, when the runtime reported a partially created container.
  virtual bool CreateContainer(const ContainerConfig& config, std::string* id,
                               std::string* error_msg) = 0;
  virtual bool StartContainer(const std::string& id,
                              std::string* error_msg) = 0;
  // The query gives up after timeout_millis.
  virtual bool InspectContainer(const std::string& id, int64_t timeout_millis,
                                ContainerState* state,
                                std::string* error_msg) = 0;
  // Last max_bytes of the combined stdout and stderr of the container.
  virtual bool ContainerLogs(const std::string& id, int64_t max_bytes,
                             std::string* logs, std::string* error_msg) = 0;
  // Asks the container to stop, killing it after grace_seconds.
  virtual bool StopContainer(const std::string& id, int32_t grace_seconds,
                             std::string* error_msg) = 0;
  // Removes the container, killing it if needed.
  virtual bool RemoveContainer(const std::string& id,
                               std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~ContainerRuntime() = default;
  ContainerRuntime() = default;
  ContainerRuntime(const ContainerRuntime&) = delete;
  ContainerRuntime(ContainerRuntime&&) = delete;
  ContainerRuntime& operator=(const ContainerRuntime&) = delete;
  ContainerRuntime& operator=(ContainerRuntime&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { ContainerRuntime::Register_(T::kName, &T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::tuple<std::string, create_t, score_t>>;
  static store_t* Runtimes_();
  static void Register_(const std::string& name, create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace container

#endif
