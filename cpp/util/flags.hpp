#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

// Values parsed from the command line. Only main reads them, to build the
// core::Config that is passed to the rest of the program.
struct Flags {
  // Common flags
  static std::string log_file;
  static std::string temp_directory;
  static bool keep_sandboxes;

  // Run flags
  static std::string isolation;
  static std::string board_file;
  static int32_t player;
  static std::string image;
  static std::string interpreter;
  static std::string runtime;
  static int64_t timeout_millis;
  static int64_t memory_limit_mb;
  static int32_t cpu_percent;
  static int32_t pids_limit;
};

#endif
