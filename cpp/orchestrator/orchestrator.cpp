#include "orchestrator/orchestrator.hpp"

#include <kj/debug.h>

#include "container/runtime.hpp"
#include "extractor/extractor.hpp"
#include "restricted/in_process_executor.hpp"
#include "sandbox/container_sandbox.hpp"
#include "sandbox/staging.hpp"

namespace orchestrator {

core::MoveCandidate MoveFromOutput(const std::string& output) {
  size_t marker = output.rfind(sandbox::kMoveMarker);
  if (marker == std::string::npos) return extractor::Extract(output);
  size_t begin = marker + std::string(sandbox::kMoveMarker).size();
  size_t end = output.find('\n', begin);
  return extractor::Extract(output.substr(
      begin, end == std::string::npos ? std::string::npos : end - begin));
}

std::unique_ptr<Orchestrator> Orchestrator::Create(const core::Config& config) {
  std::unique_ptr<container::ContainerRuntime> runtime =
      container::ContainerRuntime::Create(config);
  if (runtime) KJ_LOG(INFO, "Using container runtime", runtime->Name());
  return std::unique_ptr<Orchestrator>(new Orchestrator(
      std::unique_ptr<core::Executor>(
          new sandbox::ContainerSandbox(config, std::move(runtime))),
      std::unique_ptr<core::Executor>(new restricted::InProcessExecutor())));
}

core::ExecutionOutcome Orchestrator::Execute(
    const core::CodeSubmission& submission) {
  KJ_LOG(INFO, "Executing submission",
         core::IsolationLevelName(submission.Isolation()));
  switch (submission.Isolation()) {
    case core::IsolationLevel::STRONG: {
      core::ExecutionOutcome outcome = strong_->Run(submission);
      if (!outcome.Success()) {
        return outcome.WithMove(core::MoveCandidate::Empty(outcome.Output()));
      }
      return outcome.WithMove(MoveFromOutput(outcome.Output()));
    }
    case core::IsolationLevel::WEAK:
      return weak_->Run(submission);
  }
  KJ_FAIL_ASSERT("Unknown isolation level");
}

}  // namespace orchestrator
