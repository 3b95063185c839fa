#ifndef RESTRICTED_IN_PROCESS_EXECUTOR_HPP
#define RESTRICTED_IN_PROCESS_EXECUTOR_HPP

#include "core/executor.hpp"
#include "restricted/capabilities.hpp"

namespace restricted {

// Runs submissions in an interpreter embedded in this process. The code only
// sees board, current_player and the builtins of its CapabilitySet, so it
// cannot import modules or open files. Code that spells an attribute or name
// the CapabilitySet does not allow is rejected before it runs, since
// attribute lookups reach the interpreter without going through builtins.
// Its output is captured.
//
// This is the weak isolation level: there is no limit on wall time, CPU time
// or memory, and a submission that never terminates blocks the caller
// forever. Only one submission runs at a time in the whole process, since
// each run holds the interpreter lock.
class InProcessExecutor : public core::Executor {
 public:
  explicit InProcessExecutor(
      CapabilitySet capabilities = CapabilitySet::Default())
      : capabilities_(std::move(capabilities)) {}

  // The outcome carries the move read from next_move, if the code bound it
  // to a pair of integers. Faults are reported as RUNTIME_FAULT.
  core::ExecutionOutcome Run(const core::CodeSubmission& submission) override;

 private:
  CapabilitySet capabilities_;
};

}  // namespace restricted

#endif
