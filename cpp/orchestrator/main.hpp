#ifndef ORCHESTRATOR_MAIN_HPP
#define ORCHESTRATOR_MAIN_HPP
#include <string>

#include <kj/main.h>

#include "core/config.hpp"
#include "core/submission.hpp"

namespace orchestrator {

// Builds the configuration from the values in Flags. Returns false and sets
// error_msg if they are not valid.
bool ConfigFromFlags(core::Config* config, std::string* error_msg);

// Builds the runtime context from the values in Flags. Returns false and
// sets error_msg if the board cannot be read.
bool ContextFromFlags(core::RuntimeContext* context, std::string* error_msg);

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string code_file;
};
}  // namespace orchestrator
#endif
