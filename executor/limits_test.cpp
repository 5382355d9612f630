#include "executor/limits.hpp"

#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

proto::ExecutionLimits MakeLimits(int64_t cpu, int64_t wall, int64_t memory,
                                  int64_t output) {
  proto::ExecutionLimits limits;
  limits.set_max_cpu_seconds(cpu);
  limits.set_max_wall_seconds(wall);
  limits.set_max_memory_bytes(memory);
  limits.set_max_output_bytes(output);
  return limits;
}

// NOLINTNEXTLINE
TEST(Limits, Valid) {
  EXPECT_NO_THROW(executor::ValidateLimits(MakeLimits(10, 10, 1 << 27, 1 << 20)));
  EXPECT_NO_THROW(executor::ValidateLimits(MakeLimits(1, 5, 1, 1)));
}

// NOLINTNEXTLINE
TEST(Limits, WallSmallerThanCpu) {
  EXPECT_THROW(executor::ValidateLimits(MakeLimits(10, 5, 1, 1)),  // NOLINT
               executor::invalid_limits);
}

// NOLINTNEXTLINE
TEST(Limits, NotPositive) {
  EXPECT_THROW(executor::ValidateLimits(MakeLimits(0, 5, 1, 1)),  // NOLINT
               executor::invalid_limits);
  EXPECT_THROW(executor::ValidateLimits(MakeLimits(1, 5, 0, 1)),  // NOLINT
               executor::invalid_limits);
  EXPECT_THROW(executor::ValidateLimits(MakeLimits(1, 5, 1, -1)),  // NOLINT
               executor::invalid_limits);
}

// NOLINTNEXTLINE
TEST(Limits, FromFlagsDefaults) {
  gflags::FlagSaver saver;
  proto::ExecutionLimits limits = executor::LimitsFromFlags();
  EXPECT_EQ(limits.max_cpu_seconds(), 10);
  EXPECT_EQ(limits.max_wall_seconds(), 10);
  EXPECT_EQ(limits.max_memory_bytes(), 128 * 1024 * 1024);
  EXPECT_EQ(limits.max_output_bytes(), 1024 * 1024);
}

// NOLINTNEXTLINE
TEST(Limits, FromFlagsInvalid) {
  gflags::FlagSaver saver;
  FLAGS_max_cpu_seconds = 20;
  FLAGS_max_wall_seconds = 10;
  EXPECT_THROW(executor::LimitsFromFlags(),  // NOLINT
               executor::invalid_limits);
}

}  // namespace
