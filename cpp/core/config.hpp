#ifndef CORE_CONFIG_HPP
#define CORE_CONFIG_HPP

#include <cstdint>
#include <string>

#include "core/resource_limit_policy.hpp"

namespace core {

// Process-wide configuration. It is built once by main and passed explicitly
// to the components that need it.
struct Config {
  ResourceLimitPolicy policy;

  // Image the submissions are executed in, and the interpreter inside it.
  std::string image = "python:3.9-slim";
  std::string interpreter = "python";

  // Name of the container runtime to use ("docker", "podman"). If empty, the
  // best available one is used.
  std::string runtime;

  // Where the staging directories are created.
  std::string temp_directory = "/tmp/movebox";
  // Do not delete the staging directories, for debugging.
  bool keep_sandboxes = false;

  // Wall limits for the commands sent to the container runtime.
  int64_t command_timeout_millis = 30000;
  int64_t pull_timeout_millis = 300000;
};

}  // namespace core

#endif
