#include "core/resource_limit_policy.hpp"

#include <sstream>

namespace core {

bool ResourceLimitPolicy::Validate(std::string* error_msg) const {
  if (memory_limit_bytes < 4 * 1024 * 1024) {
    *error_msg = "The memory limit must be at least 4 MiB";
    return false;
  }
  if (memory_swap_limit_bytes < memory_limit_bytes) {
    *error_msg = "The memory+swap limit cannot be lower than the memory limit";
    return false;
  }
  if (cpu_period_micros < 1000 || cpu_period_micros > 1000000) {
    *error_msg = "The CPU period must be between 1ms and 1s";
    return false;
  }
  if (cpu_quota_micros < 1000) {
    *error_msg = "The CPU quota must be at least 1ms";
    return false;
  }
  if (pids_limit <= 0) {
    *error_msg = "The process limit must be positive";
    return false;
  }
  if (scratch_mount.empty() || scratch_mount[0] != '/') {
    *error_msg = "The scratch mount must be an absolute path";
    return false;
  }
  if (scratch_size_bytes <= 0) {
    *error_msg = "The scratch size must be positive";
    return false;
  }
  if (wall_timeout_millis <= 0) {
    *error_msg = "The timeout must be positive";
    return false;
  }
  if (stop_grace_seconds < 0) {
    *error_msg = "The stop grace period cannot be negative";
    return false;
  }
  if (poll_interval_millis <= 0 || poll_interval_millis > wall_timeout_millis) {
    *error_msg = "The poll interval must be positive and within the timeout";
    return false;
  }
  if (max_output_bytes <= 0) {
    *error_msg = "The output limit must be positive";
    return false;
  }
  return true;
}

std::string ResourceLimitPolicy::Describe() const {
  std::ostringstream out;
  out << "memory=" << memory_limit_bytes / 1024 << "KiB"
      << " memory+swap=" << memory_swap_limit_bytes / 1024 << "KiB"
      << " cpu=" << cpu_quota_micros << "/" << cpu_period_micros << "us"
      << " pids=" << pids_limit
      << " network=" << (network_disabled ? "none" : "default")
      << " root=" << (read_only_root ? "ro" : "rw") << " scratch="
      << scratch_mount << ":" << scratch_size_bytes / 1024 << "KiB"
      << " timeout=" << wall_timeout_millis << "ms"
      << " grace=" << stop_grace_seconds << "s"
      << " output=" << max_output_bytes / 1024 << "KiB";
  return out.str();
}

}  // namespace core
