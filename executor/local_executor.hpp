#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <memory>

#include "executor/admission.hpp"
#include "executor/executor.hpp"
#include "executor/runner.hpp"
#include "policy/policy_filter.hpp"

namespace executor {

// Runs requests on this machine: policy filter, then the runner in a
// sandbox, then the result assembler.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) override;
  proto::HealthResponse Health() override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

  // A max_running of 0 means one execution per core. Throws invalid_limits
  // if limits are not valid.
  LocalExecutor(policy::PolicyFilter filter, Runner runner,
                proto::ExecutionLimits limits, size_t max_running = 0,
                size_t max_queued = 16, bool echo_last_expression = true);

  // An executor configured from the command line flags.
  static std::unique_ptr<LocalExecutor> FromFlags();

 private:
  policy::PolicyFilter filter_;
  Runner runner_;
  proto::ExecutionLimits limits_;
  Admission admission_;
  bool echo_last_expression_;
};

}  // namespace executor

#endif
