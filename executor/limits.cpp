#include "executor/limits.hpp"

#include "util/flags.hpp"

namespace executor {

void ValidateLimits(const proto::ExecutionLimits& limits) {
  if (limits.max_cpu_seconds() <= 0) {
    throw invalid_limits("The CPU time limit must be positive");
  }
  if (limits.max_wall_seconds() < limits.max_cpu_seconds()) {
    throw invalid_limits(
        "The wall time limit must not be smaller than the CPU time limit");
  }
  if (limits.max_memory_bytes() <= 0) {
    throw invalid_limits("The memory limit must be positive");
  }
  if (limits.max_output_bytes() <= 0) {
    throw invalid_limits("The output limit must be positive");
  }
}

proto::ExecutionLimits LimitsFromFlags() {
  proto::ExecutionLimits limits;
  limits.set_max_cpu_seconds(FLAGS_max_cpu_seconds);
  limits.set_max_wall_seconds(FLAGS_max_wall_seconds);
  limits.set_max_memory_bytes(FLAGS_max_memory_bytes);
  limits.set_max_output_bytes(FLAGS_max_output_bytes);
  ValidateLimits(limits);
  return limits;
}

}  // namespace executor
