#ifndef CONTAINER_MOCK_RUNTIME_HPP
#define CONTAINER_MOCK_RUNTIME_HPP

#include <string>

#include "container/runtime.hpp"
#include "gmock/gmock.h"

namespace container {

class MockContainerRuntime : public ContainerRuntime {
 public:
  MOCK_CONST_METHOD0(Name, std::string());
  MOCK_METHOD1(HasImage, bool(const std::string& image));
  MOCK_METHOD2(PullImage, bool(const std::string& image,
                               std::string* error_msg));
  MOCK_METHOD3(CreateContainer,
               bool(const ContainerConfig& config, std::string* id,
                    std::string* error_msg));
  MOCK_METHOD2(StartContainer,
               bool(const std::string& id, std::string* error_msg));
  MOCK_METHOD4(InspectContainer,
               bool(const std::string& id, int64_t timeout_millis,
                    ContainerState* state, std::string* error_msg));
  MOCK_METHOD4(ContainerLogs,
               bool(const std::string& id, int64_t max_bytes,
                    std::string* logs, std::string* error_msg));
  MOCK_METHOD3(StopContainer, bool(const std::string& id,
                                   int32_t grace_seconds,
                                   std::string* error_msg));
  MOCK_METHOD2(RemoveContainer,
               bool(const std::string& id, std::string* error_msg));
};

// Container states, for use with SetArgPointee.
inline ContainerState RunningState() {
  ContainerState state;
  state.running = true;
  state.status = "running";
  return state;
}

inline ContainerState ExitedState(int32_t exit_code) {
  ContainerState state;
  state.exited = true;
  state.exit_code = exit_code;
  state.status = "exited";
  return state;
}

}  // namespace container

#endif
