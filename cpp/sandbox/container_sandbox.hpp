#ifndef SANDBOX_CONTAINER_SANDBOX_HPP
#define SANDBOX_CONTAINER_SANDBOX_HPP

#include <memory>
#include <string>

#include "container/runtime.hpp"
#include "core/config.hpp"
#include "core/executor.hpp"

namespace sandbox {

// Mount point of the staging directory inside the container.
static const constexpr char* kCodeMount = "/code";

// Runs each submission in a new container with the limits of the
// configuration's policy. Containers are created, polled and removed by the
// calling thread.
class ContainerSandbox : public core::Executor {
 public:
  // runtime may be null, in which case every run reports
  // ENVIRONMENT_UNAVAILABLE.
  ContainerSandbox(const core::Config& config,
                   std::unique_ptr<container::ContainerRuntime> runtime)
      : config_(config), runtime_(std::move(runtime)) {}

  core::ExecutionOutcome Run(const core::CodeSubmission& submission) override;

 private:
  const core::Config config_;
  std::unique_ptr<container::ContainerRuntime> runtime_;
};

}  // namespace sandbox

#endif
