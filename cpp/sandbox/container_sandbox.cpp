#include "sandbox/container_sandbox.hpp"

#include <kj/debug.h>

#include "container/handle.hpp"
#include "sandbox/staging.hpp"

namespace sandbox {

namespace {

using core::ExecutionOutcome;
using core::FailureCategory;

// Runs the container part of an execution. The handle is removed by the
// caller.
ExecutionOutcome RunContainer(const core::Config& config,
                              container::ContainerRuntime* runtime,
                              const std::string& staging_dir,
                              container::SandboxHandle* handle) {
  const core::ResourceLimitPolicy& policy = config.policy;
  std::string error_msg;

  if (!runtime->HasImage(config.image) &&
      !runtime->PullImage(config.image, &error_msg)) {
    KJ_LOG(WARNING, "Image not available", config.image, error_msg);
    return ExecutionOutcome::Failed(FailureCategory::ENVIRONMENT_UNAVAILABLE,
                                    error_msg, core::kExitSetupFailed);
  }

  container::ContainerConfig container_config = container::ConfigFromPolicy(
      policy, config.image, {config.interpreter, kScriptName});
  container_config.working_dir = kCodeMount;
  container_config.mounts.push_back({staging_dir, kCodeMount, true});
  if (!handle->Create(container_config, &error_msg)) {
    KJ_LOG(WARNING, "Cannot create container", error_msg);
    return ExecutionOutcome::Failed(FailureCategory::PROVISIONING_FAILED,
                                    error_msg, core::kExitSetupFailed);
  }
  if (!handle->Start(&error_msg)) {
    KJ_LOG(WARNING, "Cannot start container", handle->Id(), error_msg);
    return ExecutionOutcome::Failed(FailureCategory::START_FAILED, error_msg,
                                    core::kExitSetupFailed);
  }

  if (!handle->WaitForExit(policy.wall_timeout_millis,
                           policy.poll_interval_millis)) {
    if (!handle->Stop(policy.stop_grace_seconds, &error_msg)) {
      KJ_LOG(WARNING, "Cannot stop container", handle->Id(), error_msg);
    }
    std::string logs;
    if (!handle->Logs(policy.max_output_bytes, &logs, &error_msg)) {
      KJ_LOG(WARNING, "Cannot read container logs", handle->Id(), error_msg);
    }
    return ExecutionOutcome::Failed(FailureCategory::TIMED_OUT, logs,
                                    core::kExitTimedOut);
  }

  std::string logs;
  if (!handle->Logs(policy.max_output_bytes, &logs, &error_msg)) {
    KJ_LOG(WARNING, "Cannot read container logs", handle->Id(), error_msg);
  }
  if (handle->ExitCode() != 0) {
    return ExecutionOutcome::Failed(FailureCategory::EXITED_NON_ZERO, logs,
                                    handle->ExitCode());
  }
  return ExecutionOutcome::Succeeded(logs);
}

}  // namespace

core::ExecutionOutcome ContainerSandbox::Run(
    const core::CodeSubmission& submission) {
  if (!runtime_) {
    return ExecutionOutcome::Failed(FailureCategory::ENVIRONMENT_UNAVAILABLE,
                                    "No container runtime available",
                                    core::kExitSetupFailed);
  }

  std::unique_ptr<StagingArea> staging;
  kj::Maybe<kj::Exception> staging_failure =
      kj::runCatchingExceptions([&]() {
        staging.reset(new StagingArea(config_.temp_directory, submission));
      });
  KJ_IF_MAYBE(exc, staging_failure) {
    KJ_LOG(WARNING, "Cannot stage the submission", exc->getDescription());
    return ExecutionOutcome::Failed(FailureCategory::PROVISIONING_FAILED,
                                    exc->getDescription().cStr(),
                                    core::kExitSetupFailed);
  }
  if (config_.keep_sandboxes) staging->Keep();

  // Nothing thrown by the runtime leaves this function: failures while the
  // container runs become the outcome, and failures while tearing down are
  // recorded next to it.
  container::SandboxHandle handle(runtime_.get());
  ExecutionOutcome outcome = ExecutionOutcome::Failed(
      FailureCategory::PROVISIONING_FAILED, "", core::kExitSetupFailed);
  kj::Maybe<kj::Exception> run_failure = kj::runCatchingExceptions([&]() {
    outcome = RunContainer(config_, runtime_.get(), staging->Path(), &handle);
  });
  KJ_IF_MAYBE(exc, run_failure) {
    KJ_LOG(ERROR, "Container execution failed", exc->getDescription());
    outcome = ExecutionOutcome::Failed(
        handle.GetState() == container::SandboxHandle::State::kNew
            ? FailureCategory::PROVISIONING_FAILED
            : FailureCategory::START_FAILED,
        exc->getDescription().cStr(), core::kExitSetupFailed);
  }

  std::string error_msg;
  bool removed = false;
  kj::Maybe<kj::Exception> remove_failure = kj::runCatchingExceptions(
      [&]() { removed = handle.Remove(&error_msg); });
  KJ_IF_MAYBE(exc, remove_failure) {
    error_msg = exc->getDescription().cStr();
  }
  if (!removed) {
    KJ_LOG(WARNING, "Cannot remove container", handle.Id(), error_msg);
    outcome = outcome.WithTeardownError("remove container " + handle.Id() +
                                        ": " + error_msg);
  }
  if (!config_.keep_sandboxes) {
    error_msg.clear();
    bool staging_removed = false;
    kj::Maybe<kj::Exception> cleanup_failure = kj::runCatchingExceptions(
        [&]() { staging_removed = staging->Remove(&error_msg); });
    KJ_IF_MAYBE(exc, cleanup_failure) {
      error_msg = exc->getDescription().cStr();
    }
    if (!staging_removed) {
      KJ_LOG(WARNING, "Cannot remove staging directory", staging->Path(),
             error_msg);
      outcome = outcome.WithTeardownError("remove " + staging->Path() + ": " +
                                          error_msg);
    }
  }
  KJ_LOG(INFO, "Container execution finished",
         core::FailureCategoryName(outcome.Category()), outcome.ExitCode());
  return outcome;
}

}  // namespace sandbox
