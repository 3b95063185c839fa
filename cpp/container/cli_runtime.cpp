#include "container/cli_runtime.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <kj/debug.h>

#include "util/misc.hpp"
#include "util/which.hpp"

namespace container {

constexpr const char* CliRuntime::kInspectFormat;
constexpr const char* DockerRuntime::kName;
constexpr const char* PodmanRuntime::kName;

namespace {
ContainerRuntime::Register<DockerRuntime> docker;  // NOLINT
ContainerRuntime::Register<PodmanRuntime> podman;  // NOLINT
}  // namespace

int CliRuntime::ScoreExecutable(const std::string& executable, int score) {
  try {
    if (util::which(executable).empty()) return -1;
  } catch (const std::runtime_error& exc) {
    KJ_LOG(WARNING, "Cannot look for the container runtime", exc.what());
    return -1;
  }
  return score;
}

util::SubprocessOptions CliRuntime::Options(
    const std::vector<std::string>& args, int64_t timeout_millis) const {
  util::SubprocessOptions options(executable_);
  options.args = args;
  options.wall_limit_millis = timeout_millis;
  return options;
}

bool CliRuntime::Command(const util::SubprocessOptions& options,
                         util::CommandOutput* output, std::string* error_msg) {
  std::string what =
      executable_ + " " + (options.args.empty() ? "" : options.args[0]);
  if (!util::Subprocess::Capture(options, temp_directory_, output,
                                 error_msg)) {
    *error_msg = what + ": " + *error_msg;
    return false;
  }
  if (output->info.killed) {
    *error_msg = what + ": timed out after " +
                 std::to_string(options.wall_limit_millis) + "ms";
    return false;
  }
  if (!output->Succeeded()) {
    std::string reason =
        util::trim(options.merge_stderr ? output->out : output->err);
    if (reason.empty()) {
      reason = output->info.signal != 0
                   ? "killed by signal " + std::to_string(output->info.signal)
                   : "exit code " + std::to_string(output->info.status_code);
    }
    *error_msg = what + ": " + reason;
    return false;
  }
  return true;
}

std::vector<std::string> CliRuntime::CreateArgs(const ContainerConfig& config) {
  std::vector<std::string> args = {"create"};
  auto add = [&args](const std::string& flag, const std::string& value) {
    args.push_back(flag);
    args.push_back(value);
  };
  if (config.memory_bytes > 0) {
    add("--memory", std::to_string(config.memory_bytes));
  }
  if (config.memory_swap_bytes > 0) {
    add("--memory-swap", std::to_string(config.memory_swap_bytes));
  }
  if (config.cpu_period_micros > 0) {
    add("--cpu-period", std::to_string(config.cpu_period_micros));
  }
  if (config.cpu_quota_micros > 0) {
    add("--cpu-quota", std::to_string(config.cpu_quota_micros));
  }
  if (config.pids_limit > 0) {
    add("--pids-limit", std::to_string(config.pids_limit));
  }
  if (config.network_disabled) add("--network", "none");
  if (config.read_only_root) args.push_back("--read-only");
  if (!config.scratch_path.empty()) {
    std::string tmpfs = config.scratch_path + ":rw";
    if (config.scratch_size_bytes > 0) {
      tmpfs += ",size=" + std::to_string(config.scratch_size_bytes);
    }
    add("--tmpfs", tmpfs);
  }
  for (const Mount& mount : config.mounts) {
    add("-v", mount.source + ":" + mount.target +
                  (mount.read_only ? ":ro" : ":rw"));
  }
  if (!config.working_dir.empty()) add("-w", config.working_dir);
  args.push_back(config.image);
  args.insert(args.end(), config.command.begin(), config.command.end());
  return args;
}

bool CliRuntime::ParseState(const std::string& text, ContainerState* state,
                            std::string* error_msg) {
  std::istringstream in(text);
  std::string status;
  int32_t exit_code = 0;
  if (!(in >> status >> exit_code)) {
    *error_msg = "Unexpected container state: " + util::trim(text);
    return false;
  }
  state->status = status;
  state->running = status == "running";
  state->exited = status == "exited" || status == "dead";
  state->exit_code = exit_code;
  return true;
}

bool CliRuntime::HasImage(const std::string& image) {
  util::CommandOutput output;
  std::string error_msg;
  if (!Command(Options({"image", "inspect", image}, command_timeout_millis_),
               &output, &error_msg)) {
    KJ_LOG(INFO, "Image not available", image, error_msg);
    return false;
  }
  return true;
}

bool CliRuntime::PullImage(const std::string& image, std::string* error_msg) {
  KJ_LOG(INFO, "Pulling image", image);
  util::CommandOutput output;
  return Command(Options({"pull", image}, pull_timeout_millis_), &output,
                 error_msg);
}

bool CliRuntime::CreateContainer(const ContainerConfig& config, std::string* id,
                                 std::string* error_msg) {
  util::CommandOutput output;
  bool ok = Command(Options(CreateArgs(config), command_timeout_millis_),
                    &output, error_msg);
  // The id is printed as soon as the container exists, even if a later step
  // of the creation fails.
  *id = util::trim(output.out);
  if (ok && id->empty()) {
    *error_msg = executable_ + " create: no container id was printed";
    return false;
  }
  return ok;
}

bool CliRuntime::StartContainer(const std::string& id,
                                std::string* error_msg) {
  util::CommandOutput output;
  return Command(Options({"start", id}, command_timeout_millis_), &output,
                 error_msg);
}

bool CliRuntime::InspectContainer(const std::string& id,
                                  int64_t timeout_millis,
                                  ContainerState* state,
                                  std::string* error_msg) {
  KJ_REQUIRE(timeout_millis > 0, "Invalid inspect timeout", timeout_millis);
  util::CommandOutput output;
  if (!Command(Options({"inspect", "--format", kInspectFormat, id},
                       std::min(timeout_millis, command_timeout_millis_)),
               &output, error_msg)) {
    return false;
  }
  return ParseState(output.out, state, error_msg);
}

bool CliRuntime::ContainerLogs(const std::string& id, int64_t max_bytes,
                               std::string* logs, std::string* error_msg) {
  KJ_REQUIRE(max_bytes > 0, "Invalid output limit", max_bytes);
  util::SubprocessOptions options =
      Options({"logs", id}, command_timeout_millis_);
  options.merge_stderr = true;
  options.max_output_bytes = static_cast<uint64_t>(max_bytes);
  util::CommandOutput output;
  if (!Command(options, &output, error_msg)) return false;
  *logs = output.out;
  return true;
}

bool CliRuntime::StopContainer(const std::string& id, int32_t grace_seconds,
                               std::string* error_msg) {
  util::CommandOutput output;
  // The client waits for the grace period before killing the container.
  return Command(Options({"stop", "-t", std::to_string(grace_seconds), id},
                         command_timeout_millis_ + grace_seconds * 1000LL),
                 &output, error_msg);
}

bool CliRuntime::RemoveContainer(const std::string& id,
                                 std::string* error_msg) {
  util::CommandOutput output;
  return Command(Options({"rm", "-f", id}, command_timeout_millis_), &output,
                 error_msg);
}

}  // namespace container
