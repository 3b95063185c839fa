#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <fstream>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Formats kj log messages and exceptions for the lifetime of the object.
// Messages go to log_file, or to stderr if it is empty. Colors are only used
// when writing to a terminal.
class LogManager : public kj::ExceptionCallback {
 public:
  LogManager(kj::ProcessContext& context, const std::string& log_file);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ofstream file_;
  std::ostream& out_;
  bool colors_;
  backward::SignalHandling sh_;  // Override kj's signal handling.
};
}  // namespace util

#endif
