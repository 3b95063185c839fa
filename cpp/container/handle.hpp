#ifndef CONTAINER_HANDLE_HPP
#define CONTAINER_HANDLE_HPP

#include <cstdint>
#include <string>

#include <kj/common.h>

#include "container/runtime.hpp"

namespace container {

// One container, from its creation to its removal. The handle is owned by a
// single thread for its whole lifetime. If the container was created, it is
// removed when the handle is destroyed, unless Remove was already called.
class SandboxHandle {
 public:
  enum class State {
    // No container exists yet.
    kNew,
    kCreated,
    kStarted,
    kRunning,
    kExited,
    kTimedOut,
    // Forced removal was attempted. Terminal.
    kRemoved
  };
  static const char* StateName(State state);

  // runtime must outlive the handle.
  explicit SandboxHandle(ContainerRuntime* runtime) : runtime_(runtime) {}
  ~SandboxHandle();
  KJ_DISALLOW_COPY(SandboxHandle);

  // Creates the container. On failure the handle keeps the id of a partially
  // created container, if the runtime reported one, so that it gets removed.
  bool Create(const ContainerConfig& config, std::string* error_msg);

  bool Start(std::string* error_msg);

  // Polls the container every poll_interval_millis until it exits or
  // timeout_millis elapse since the call. Each status query is given the time
  // left, and at least poll_interval_millis. Failing status queries are logged
  // and polling goes on. Returns true if the container exited, and false if
  // the state is now kTimedOut.
  bool WaitForExit(int64_t timeout_millis, int64_t poll_interval_millis);

  // Stops a running container, giving it grace_seconds to terminate.
  bool Stop(int32_t grace_seconds, std::string* error_msg);

  // Last max_bytes of the combined output of the container so far.
  bool Logs(int64_t max_bytes, std::string* logs, std::string* error_msg);

  // Removes the container, whatever its state. After this call the state is
  // kRemoved even if the runtime reported an error or threw. Does nothing if
  // there is no container.
  bool Remove(std::string* error_msg);

  State GetState() const { return state_; }
  const std::string& Id() const { return id_; }
  // Only meaningful in state kExited.
  int32_t ExitCode() const { return exit_code_; }

 private:
  ContainerRuntime* runtime_;
  State state_ = State::kNew;
  std::string id_;
  int32_t exit_code_ = 0;
};

}  // namespace container

#endif
