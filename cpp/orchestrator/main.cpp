#include "orchestrator/main.hpp"

#include <iostream>
#include <system_error>

#include <kj/debug.h>

#include "extractor/extractor.hpp"
#include "orchestrator/orchestrator.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/notebook.hpp"
#include "util/version.hpp"

namespace orchestrator {

namespace {
const constexpr char* kNotebookExtension = ".ipynb";

bool IsNotebook(const std::string& path) {
  std::string extension = kNotebookExtension;
  return path.size() >= extension.size() &&
         path.compare(path.size() - extension.size(), extension.size(),
                      extension) == 0;
}
}  // namespace

bool ConfigFromFlags(core::Config* config, std::string* error_msg) {
  if (Flags::cpu_percent <= 0) {
    *error_msg = "The CPU share must be positive";
    return false;
  }
  if (Flags::memory_limit_mb <= 0) {
    *error_msg = "The memory limit must be positive";
    return false;
  }
  core::ResourceLimitPolicy& policy = config->policy;
  policy.memory_limit_bytes = Flags::memory_limit_mb * 1024 * 1024;
  policy.memory_swap_limit_bytes = policy.memory_limit_bytes;
  policy.cpu_quota_micros = policy.cpu_period_micros * Flags::cpu_percent / 100;
  policy.pids_limit = Flags::pids_limit;
  policy.wall_timeout_millis = Flags::timeout_millis;
  if (policy.poll_interval_millis > policy.wall_timeout_millis &&
      policy.wall_timeout_millis > 0) {
    policy.poll_interval_millis = policy.wall_timeout_millis;
  }
  if (!policy.Validate(error_msg)) return false;

  config->image = Flags::image;
  config->interpreter = Flags::interpreter;
  config->runtime = Flags::runtime;
  config->temp_directory = Flags::temp_directory;
  config->keep_sandboxes = Flags::keep_sandboxes;
  return true;
}

bool ContextFromFlags(core::RuntimeContext* context, std::string* error_msg) {
  context->current_player = Flags::player;
  if (Flags::board_file.empty()) {
    context->board = core::EmptyBoard();
    return true;
  }
  std::string text;
  try {
    text = util::File::Read(Flags::board_file);
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  if (!core::ParseBoard(text, &context->board, error_msg)) {
    *error_msg = Flags::board_file + ": " + *error_msg;
    return false;
  }
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context, Flags::log_file);

  core::Config config;
  core::RuntimeContext runtime_context;
  core::IsolationLevel isolation = core::IsolationLevel::STRONG;
  std::string error_msg;
  if (!ConfigFromFlags(&config, &error_msg) ||
      !ContextFromFlags(&runtime_context, &error_msg)) {
    return kj::str(error_msg.c_str());
  }
  if (!core::ParseIsolationLevel(Flags::isolation, &isolation)) {
    return "The isolation level must be strong or weak";
  }

  std::string code;
  try {
    code = util::File::Read(code_file);
  } catch (const std::system_error& exc) {
    return kj::str(exc.what());
  }
  if (IsNotebook(code_file)) {
    kj::Maybe<kj::Exception> failure = kj::runCatchingExceptions(
        [&code]() { code = util::NotebookToScript(code); });
    KJ_IF_MAYBE(exc, failure) {
      return kj::str("Invalid notebook: ", exc->getDescription());
    }
  }

  KJ_LOG(INFO, "Configuration", config.policy.Describe());
  std::unique_ptr<Orchestrator> orchestrator = Orchestrator::Create(config);
  core::ExecutionOutcome outcome = orchestrator->Execute(
      core::CodeSubmission(code, isolation, runtime_context));

  std::cout << "Category: " << core::FailureCategoryName(outcome.Category())
            << std::endl;
  std::cout << "Exit code: " << outcome.ExitCode() << std::endl;
  std::cout << "Move: "
            << (outcome.Move().has_move ? extractor::FormatMove(outcome.Move())
                                        : "none")
            << std::endl;
  if (!outcome.TeardownError().empty()) {
    std::cout << "Teardown error: " << outcome.TeardownError() << std::endl;
  }
  std::cout << "Output:" << std::endl << outcome.Output() << std::flush;
  if (!outcome.Move().has_move) {
    context.exitError("No move was produced");
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(
             context, "Movebox Runner (" + util::version + ")",
             "Runs the code in <code-file> (a script, or a notebook if it "
             "ends in .ipynb) and prints the move it produces. With strong "
             "isolation the code runs in a container with no network and "
             "limited memory, CPU and processes. With weak isolation it runs "
             "inside this process with a reduced set of builtins, and no "
             "time or memory limit is enforced.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the sandboxes after the execution")
      .addOptionWithArg({'i', "isolation"}, util::setString(Flags::isolation),
                        "<LEVEL>", "Isolation level, strong or weak")
      .addOptionWithArg({'b', "board"}, util::setString(Flags::board_file),
                        "<FILE>",
                        "File with the board, one row per line. By default "
                        "the board is empty")
      .addOptionWithArg({'p', "player"}, util::setInt(Flags::player), "<N>",
                        "Player that moves next")
      .addOptionWithArg({"image"}, util::setString(Flags::image), "<IMAGE>",
                        "Container image to run the code in")
      .addOptionWithArg({"interpreter"}, util::setString(Flags::interpreter),
                        "<CMD>", "Interpreter inside the container image")
      .addOptionWithArg({'r', "runtime"}, util::setString(Flags::runtime),
                        "<NAME>",
                        "Container runtime to use (docker, podman). By "
                        "default the best available one")
      .addOptionWithArg({'t', "timeout-ms"},
                        util::setInt64(Flags::timeout_millis), "<MS>",
                        "Wall time limit of the container, in milliseconds")
      .addOptionWithArg({'m', "memory-mb"},
                        util::setInt64(Flags::memory_limit_mb), "<MB>",
                        "Memory limit of the container, in megabytes")
      .addOptionWithArg({'c', "cpu-percent"},
                        util::setInt(Flags::cpu_percent), "<PERCENT>",
                        "Share of a CPU the container can use")
      .addOptionWithArg({"pids"}, util::setInt(Flags::pids_limit), "<N>",
                        "Maximum number of processes in the container")
      .expectArg("<code-file>", util::setString(code_file))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace orchestrator
