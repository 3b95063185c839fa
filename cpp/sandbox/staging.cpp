#include "sandbox/staging.hpp"

#include <sys/stat.h>

#include <sstream>

namespace sandbox {

std::string ComposeScript(const std::string& code,
                          const core::RuntimeContext& context) {
  std::ostringstream script;
  script << "board = [";
  for (size_t r = 0; r < context.board.size(); r++) {
    if (r != 0) script << ", ";
    script << "[";
    for (size_t c = 0; c < context.board[r].size(); c++) {
      if (c != 0) script << ", ";
      script << context.board[r][c];
    }
    script << "]";
  }
  script << "]\n";
  script << "current_player = " << context.current_player << "\n";
  script << code;
  if (code.empty() || code.back() != '\n') script << "\n";
  script << "\ntry:\n"
         << "    next_move\n"
         << "except NameError:\n"
         << "    pass\n"
         << "else:\n"
         << "    print(\"" << kMoveMarker << "\", next_move, flush=True)\n";
  return script.str();
}

StagingArea::StagingArea(const std::string& base,
                         const core::CodeSubmission& submission)
    : dir_(base) {
  util::File::SetMode(dir_.Path(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH |
                                       S_IXOTH);
  std::string script = ScriptPath();
  util::File::Write(script,
                    ComposeScript(submission.Code(), submission.Context()));
  util::File::SetMode(script, S_IRUSR | S_IRGRP | S_IROTH);
}

std::string StagingArea::ScriptPath() const {
  return util::File::JoinPath(dir_.Path(), kScriptName);
}

}  // namespace sandbox
