#ifndef SANDBOX_STAGING_HPP
#define SANDBOX_STAGING_HPP

#include <string>

#include "core/submission.hpp"
#include "util/file.hpp"

namespace sandbox {

// Name of the script inside the staging directory.
static const constexpr char* kScriptName = "user_code.py";
// Printed before the value of next_move, if the code defines it.
static const constexpr char* kMoveMarker = "__next_move__";

// Builds the script that is executed: a prelude that binds board and
// current_player, the submitted code, and an epilogue that prints the marker
// followed by next_move when the code bound that name.
std::string ComposeScript(const std::string& code,
                          const core::RuntimeContext& context);

// A directory, created inside a base directory, containing the script of one
// submission. The directory is world-readable and the script read-only. The
// directory is deleted on destruction unless Keep or Remove are called.
class StagingArea {
 public:
  // Throws std::system_error if the directory or the script cannot be
  // created.
  StagingArea(const std::string& base, const core::CodeSubmission& submission);

  const std::string& Path() const { return dir_.Path(); }
  std::string ScriptPath() const;

  void Keep() { dir_.Keep(); }
  bool Remove(std::string* error_msg) { return dir_.Remove(error_msg); }

 private:
  util::TempDir dir_;
};

}  // namespace sandbox

#endif
