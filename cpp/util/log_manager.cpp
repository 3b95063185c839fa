#include "util/log_manager.hpp"

#include <unistd.h>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "util/file.hpp"

namespace util {
namespace {

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                         "\e[7;31m", "\e[0;35m"};
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

#undef CHECK_MSG

}  // namespace

LogManager::LogManager(kj::ProcessContext& context,
                       const std::string& log_file)
    : out_(log_file.empty() ? std::cerr : file_),
      colors_(log_file.empty() && isatty(STDERR_FILENO)) {
  if (!log_file.empty()) {
    file_.open(log_file, std::ios::app);
    if (!file_) context.exitError("Invalid log file provided!");
  }
}

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      colors_ ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out_);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int /*contextDepth*/,
                            kj::String&& text) {
  auto paint = [this](const char* color, const std::string& s) {
    return colors_ ? color + s + reset_color : s;
  };
  auto t = std::time(nullptr);
  auto tm = *std::localtime(&t);
  std::ostringstream date;
  date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  out_ << paint(date_color, date.str()) << " ";
  out_ << paint(colors[(int)severity],
                std::string(1, log_msg[(int)severity][0]))
       << " ";
  out_ << std::left << std::setw(colors_ ? 35 : 25)
       << paint(file_color,
                util::File::BaseName(file) + ":" + std::to_string(line));
  out_ << text.cStr() << std::endl;
}
}  // namespace util
