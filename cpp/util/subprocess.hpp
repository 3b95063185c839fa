#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Settings to run a child process.
struct SubprocessOptions {
  // Required values
  std::string executable;

  // Optional values
  std::vector<std::string> args;
  std::string working_directory;
  std::string stdout_file;
  std::string stderr_file;
  // Sends stderr to the same destination as stdout.
  bool merge_stderr = false;
  // The whole process group is killed when the limit is exceeded.
  int64_t wall_limit_millis = 0;
  // If not zero, Capture keeps only the last max_output_bytes of each stream.
  uint64_t max_output_bytes = 0;

  explicit SubprocessOptions(std::string executable)
      : executable(std::move(executable)) {}
};

// Results of the execution.
struct SubprocessInfo {
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
};

// Output of a command whose stdout and stderr were captured.
struct CommandOutput {
  SubprocessInfo info;
  std::string out;
  std::string err;

  bool Succeeded() const { return info.signal == 0 && info.status_code == 0; }
};

class Subprocess {
 public:
  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  static bool Run(const SubprocessOptions& options, SubprocessInfo* info,
                  std::string* error_msg);

  // Runs options.executable with stdout and stderr redirected to files in a
  // temporary directory created inside temp_directory, and reads them back.
  // The file names in options are ignored; if merge_stderr is set, both
  // streams end up in output->out.
  static bool Capture(SubprocessOptions options,
                      const std::string& temp_directory, CommandOutput* output,
                      std::string* error_msg);

 private:
  explicit Subprocess(const SubprocessOptions& options) : options_(options) {}

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit.
  bool Wait(SubprocessInfo* info, std::string* error_msg);

  const SubprocessOptions& options_;
  // Prepared before forking, since the child must not allocate memory.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  int pipe_fds_[2] = {};
  int child_pid_ = 0;
};

}  // namespace util

#endif
