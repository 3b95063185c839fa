#ifndef ORCHESTRATOR_ORCHESTRATOR_HPP
#define ORCHESTRATOR_ORCHESTRATOR_HPP

#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/executor.hpp"

namespace orchestrator {

// Finds the move in the output of a strongly-isolated run: the text after the
// last move marker if there is one, else the whole output.
core::MoveCandidate MoveFromOutput(const std::string& output);

// Sends each submission to the executor of its isolation level. A failure is
// never retried with the other level.
class Orchestrator {
 public:
  // Uses the container runtime named in the configuration, or the best one
  // available. Runs with strong isolation fail with ENVIRONMENT_UNAVAILABLE if
  // there is none.
  static std::unique_ptr<Orchestrator> Create(const core::Config& config);

  Orchestrator(std::unique_ptr<core::Executor> strong,
               std::unique_ptr<core::Executor> weak)
      : strong_(std::move(strong)), weak_(std::move(weak)) {}

  // The outcome of a successful strong run carries the move extracted from
  // its output; the weak executor reads the move by itself.
  core::ExecutionOutcome Execute(const core::CodeSubmission& submission);

 private:
  std::unique_ptr<core::Executor> strong_;
  std::unique_ptr<core::Executor> weak_;
};

}  // namespace orchestrator

#endif
