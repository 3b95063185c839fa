#ifndef CORE_RESOURCE_LIMIT_POLICY_HPP
#define CORE_RESOURCE_LIMIT_POLICY_HPP

#include <cstdint>
#include <string>

namespace core {

// Ceilings applied to every strongly-isolated execution. Built once at
// startup and never modified afterwards.
struct ResourceLimitPolicy {
  int64_t memory_limit_bytes = 128LL * 1024 * 1024;
  // Memory plus swap. Equal to memory_limit_bytes means no swap at all.
  int64_t memory_swap_limit_bytes = 128LL * 1024 * 1024;
  // The container gets cpu_quota_micros of CPU time every cpu_period_micros.
  int64_t cpu_period_micros = 100000;
  int64_t cpu_quota_micros = 50000;
  int32_t pids_limit = 10;

  bool network_disabled = true;
  bool read_only_root = true;
  // Writable tmpfs, the only place where the code can create files.
  std::string scratch_mount = "/tmp";
  int64_t scratch_size_bytes = 64LL * 1024 * 1024;

  int64_t wall_timeout_millis = 2000;
  int32_t stop_grace_seconds = 1;
  int64_t poll_interval_millis = 100;

  // Only the last max_output_bytes of the container output are kept.
  int64_t max_output_bytes = 64 * 1024;

  // Returns false and sets error_msg if the values are inconsistent.
  bool Validate(std::string* error_msg) const;

  // Human readable summary, for logging.
  std::string Describe() const;
};

}  // namespace core

#endif
