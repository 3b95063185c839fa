#ifndef CORE_EXECUTOR_HPP
#define CORE_EXECUTOR_HPP

#include "core/outcome.hpp"
#include "core/submission.hpp"

namespace core {

// Something that runs a submission. Implementations never throw: every
// failure is reported through the category of the returned outcome.
class Executor {
 public:
  virtual ExecutionOutcome Run(const CodeSubmission& submission) = 0;

  virtual ~Executor() = default;
  Executor() = default;
  Executor(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace core

#endif
