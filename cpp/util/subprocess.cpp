#include "util/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/which.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::vector<char> ToArg(const std::string& s) {
  std::vector<char> arg(s.begin(), s.end());
  arg.push_back('\0');
  return arg;
}
}  // namespace

namespace util {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Subprocess::Run(const SubprocessOptions& options, SubprocessInfo* info,
                     std::string* error_msg) {
  Subprocess process(options);
  if (!process.Setup(error_msg)) return false;
  if (!process.DoFork(error_msg)) return false;
  return process.Wait(info, error_msg);
}

bool Subprocess::Capture(SubprocessOptions options,
                         const std::string& temp_directory,
                         CommandOutput* output, std::string* error_msg) {
  try {
    TempDir tmp(temp_directory);
    options.stdout_file = File::JoinPath(tmp.Path(), "stdout");
    options.stderr_file =
        options.merge_stderr ? "" : File::JoinPath(tmp.Path(), "stderr");
    if (!Run(options, &output->info, error_msg)) return false;
    auto read = [&options](const std::string& path) {
      return options.max_output_bytes == 0
                 ? File::Read(path)
                 : File::ReadTail(path, options.max_output_bytes);
    };
    output->out = read(options.stdout_file);
    output->err = options.merge_stderr ? "" : read(options.stderr_file);
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  return true;
}

bool Subprocess::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  std::string executable = options_.executable;
  if (executable.find('/') == std::string::npos) {
    try {
      executable = which(executable);
    } catch (const std::runtime_error& exc) {
      *error_msg = std::string("exec: ") + exc.what();
      return false;
    }
    if (executable.empty()) {
      *error_msg = "exec: " + options_.executable + " not found in PATH";
      return false;
    }
  }
  arg_storage_.push_back(ToArg(executable));
  for (const std::string& arg : options_.args) {
    arg_storage_.push_back(ToArg(arg));
  }
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  if (pipe(pipe_fds_) == -1) {  // NOLINT
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||  // NOLINT
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  return true;
}

bool Subprocess::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Subprocess::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    KJ_SYSCALL(write(pipe_fds_[1], &len, sizeof(len)), "Failed to write to fd");
    KJ_SYSCALL(write(pipe_fds_[1], buf, len), "Failed to write to fd");
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // New session, so that the whole group can be killed and we do not forward
  // Ctrl-Cs from the terminal.
  if (setsid() == -1) die("setsid", errno);

  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_.stdout_file.empty()) {
    stdout_fd = open(options_.stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_.stderr_file.empty() && !options_.merge_stderr) {
    stderr_fd = open(options_.stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (!options_.working_directory.empty() &&
      chdir(options_.working_directory.c_str()) == -1) {
    die("chdir", errno);
  }

  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd == -1) die("open", errno);
  if (dup2(null_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (stdout_fd != -1 && dup2(stdout_fd, STDOUT_FILENO) == -1) {
    die("redir stdout", errno);
  }
  if (options_.merge_stderr) {
    if (dup2(STDOUT_FILENO, STDERR_FILENO) == -1) die("redir stderr", errno);
  } else if (stderr_fd != -1 && dup2(stderr_fd, STDERR_FILENO) == -1) {
    die("redir stderr", errno);
  }

  execv(argv_[0], argv_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Subprocess::Wait(SubprocessInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= static_cast<ssize_t>(PIPE_BUF)) error_len = PIPE_BUF - 1;
    KJ_SYSCALL(read(pipe_fds_[0], error, error_len), "Failed to read from fd");
    close(pipe_fds_[0]);
    *error_msg = error;
    int child_status = 0;
    waitpid(child_pid_, &child_status, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  while (!options_.wall_limit_millis ||
         elapsed_millis() < options_.wall_limit_millis) {
    int ret = waitpid(child_pid_, &child_status, WNOHANG);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = "waitpid: ";
      char buf[kStrErrorBufSize] = {};
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    KJ_LOG(WARNING, "Killing process over its wall limit", argv_[0],
           options_.wall_limit_millis);
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_SYSCALL(kill(child_pid_, SIGKILL), "kill");
    }
    int ret = 0;
    while ((ret = waitpid(child_pid_, &child_status, 0)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      *error_msg = "waitpid: ";
      char buf[kStrErrorBufSize] = {};
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->killed = !has_exited;
  info->wall_time_millis = elapsed_millis();
  return true;
}

}  // namespace util
