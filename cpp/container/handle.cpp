#include "container/handle.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <kj/debug.h>

namespace container {

const char* SandboxHandle::StateName(State state) {
  switch (state) {
    case State::kNew:
      return "new";
    case State::kCreated:
      return "created";
    case State::kStarted:
      return "started";
    case State::kRunning:
      return "running";
    case State::kExited:
      return "exited";
    case State::kTimedOut:
      return "timed out";
    case State::kRemoved:
      return "removed";
  }
  return "unknown";
}

SandboxHandle::~SandboxHandle() {
  if (state_ == State::kRemoved || id_.empty()) return;
  std::string error_msg;
  bool removed = false;
  kj::Maybe<kj::Exception> failure =
      kj::runCatchingExceptions([&]() { removed = Remove(&error_msg); });
  KJ_IF_MAYBE(exc, failure) { error_msg = exc->getDescription().cStr(); }
  if (!removed) KJ_LOG(ERROR, "Cannot remove container", id_, error_msg);
}

bool SandboxHandle::Create(const ContainerConfig& config,
                           std::string* error_msg) {
  KJ_REQUIRE(state_ == State::kNew, "Container already created",
             StateName(state_));
  std::string id;
  bool ok = runtime_->CreateContainer(config, &id, error_msg);
  id_ = id;
  if (!ok) {
    if (!id_.empty()) {
      KJ_LOG(WARNING, "Container partially created", id_, *error_msg);
    }
    return false;
  }
  state_ = State::kCreated;
  KJ_LOG(INFO, "Container created", id_);
  return true;
}

bool SandboxHandle::Start(std::string* error_msg) {
  KJ_REQUIRE(state_ == State::kCreated, "Container cannot be started",
             StateName(state_));
  if (!runtime_->StartContainer(id_, error_msg)) return false;
  state_ = State::kStarted;
  return true;
}

bool SandboxHandle::WaitForExit(int64_t timeout_millis,
                                int64_t poll_interval_millis) {
  KJ_REQUIRE(state_ == State::kStarted || state_ == State::kRunning,
             "Container is not running", StateName(state_));
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_millis);
  while (true) {
    ContainerState container_state;
    std::string error_msg;
    int64_t remaining_millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now())
            .count();
    if (!runtime_->InspectContainer(
            id_, std::max(remaining_millis, poll_interval_millis),
            &container_state, &error_msg)) {
      KJ_LOG(WARNING, "Cannot inspect container", id_, error_msg);
    } else if (container_state.exited) {
      state_ = State::kExited;
      exit_code_ = container_state.exit_code;
      return true;
    } else if (container_state.running) {
      state_ = State::kRunning;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    auto wait = std::chrono::milliseconds(poll_interval_millis);
    if (now + wait > deadline) {
      std::this_thread::sleep_until(deadline);
    } else {
      std::this_thread::sleep_for(wait);
    }
  }
  state_ = State::kTimedOut;
  KJ_LOG(WARNING, "Container over its wall limit", id_, timeout_millis);
  return false;
}

bool SandboxHandle::Stop(int32_t grace_seconds, std::string* error_msg) {
  KJ_REQUIRE(state_ != State::kNew && state_ != State::kRemoved,
             "No container to stop", StateName(state_));
  return runtime_->StopContainer(id_, grace_seconds, error_msg);
}

bool SandboxHandle::Logs(int64_t max_bytes, std::string* logs,
                         std::string* error_msg) {
  KJ_REQUIRE(state_ != State::kNew && state_ != State::kRemoved,
             "No container to read the logs of", StateName(state_));
  if (!runtime_->ContainerLogs(id_, max_bytes, logs, error_msg)) return false;
  if (logs->size() > static_cast<uint64_t>(max_bytes)) {
    logs->erase(0, logs->size() - static_cast<size_t>(max_bytes));
  }
  return true;
}

bool SandboxHandle::Remove(std::string* error_msg) {
  if (state_ == State::kRemoved) return true;
  if (id_.empty()) {
    state_ = State::kRemoved;
    return true;
  }
  state_ = State::kRemoved;
  bool ok = runtime_->RemoveContainer(id_, error_msg);
  if (ok) KJ_LOG(INFO, "Container removed", id_);
  return ok;
}

}  // namespace container
