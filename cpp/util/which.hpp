#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in one of the PATH directories, or an empty
// string. Throws if PATH is not set.
// Found commands are cached, so a later lookup of the same command returns the
// cached path even if the file was removed in the meantime, unless use_cache
// is false.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
