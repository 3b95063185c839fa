#include "container/runtime.hpp"

#include <kj/debug.h>

namespace container {

ContainerConfig ConfigFromPolicy(const core::ResourceLimitPolicy& policy,
                                 const std::string& image,
                                 std::vector<std::string> command) {
  ContainerConfig config;
  config.image = image;
  config.command = std::move(command);
  config.scratch_path = policy.scratch_mount;
  config.scratch_size_bytes = policy.scratch_size_bytes;
  config.memory_bytes = policy.memory_limit_bytes;
  config.memory_swap_bytes = policy.memory_swap_limit_bytes;
  config.cpu_period_micros = policy.cpu_period_micros;
  config.cpu_quota_micros = policy.cpu_quota_micros;
  config.pids_limit = policy.pids_limit;
  config.network_disabled = policy.network_disabled;
  config.read_only_root = policy.read_only_root;
  return config;
}

ContainerRuntime::store_t* ContainerRuntime::Runtimes_() {
  static store_t* runtimes = new store_t;
  return runtimes;
}

void ContainerRuntime::Register_(const std::string& name,
                                 ContainerRuntime::create_t create,
                                 ContainerRuntime::score_t score) {
  Runtimes_()->emplace_back(name, create, score);
}

std::unique_ptr<ContainerRuntime> ContainerRuntime::Create(
    const core::Config& config) {
  const store_t& runtimes = *Runtimes_();
  int best_score = 0;
  const create_t* best = nullptr;
  for (const auto& runtime : runtimes) {
    if (!config.runtime.empty() && std::get<0>(runtime) != config.runtime) {
      continue;
    }
    int score = std::get<2>(runtime)();
    if (score > best_score) {
      best_score = score;
      best = &std::get<1>(runtime);
    }
  }
  if (best == nullptr) {
    if (config.runtime.empty()) {
      KJ_LOG(WARNING, "No container runtime could be found");
    } else {
      KJ_LOG(WARNING, "Container runtime not available", config.runtime);
    }
    return nullptr;
  }
  return std::unique_ptr<ContainerRuntime>((*best)(config));
}

}  // namespace container
