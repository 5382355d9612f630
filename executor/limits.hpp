#ifndef EXECUTOR_LIMITS_HPP
#define EXECUTOR_LIMITS_HPP

#include <stdexcept>

#include "proto/codebox.pb.h"

namespace executor {

class invalid_limits : public std::runtime_error {
 public:
  explicit invalid_limits(const std::string& msg) : std::runtime_error(msg) {}
};

// Throws invalid_limits unless every limit is positive and the wall time
// limit is not smaller than the CPU time limit.
void ValidateLimits(const proto::ExecutionLimits& limits);

// The process-wide limits, from --max_cpu_seconds, --max_wall_seconds,
// --max_memory_bytes and --max_output_bytes.
proto::ExecutionLimits LimitsFromFlags();

}  // namespace executor

#endif
