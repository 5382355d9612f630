#include "executor/result_assembler.hpp"

#include "policy/policy_filter.hpp"

namespace executor {

proto::ExecutionResult AssembleResult(const proto::PolicyViolation* violation,
                                      const RunnerOutcome* outcome) {
  proto::ExecutionResult result;
  if (violation != nullptr) {
    result.set_outcome(proto::REJECTED_BY_POLICY);
    result.set_reason(policy::Describe(*violation));
    *result.mutable_violation() = *violation;
    return result;
  }
  if (outcome == nullptr) {
    result.set_outcome(proto::INTERNAL_ERROR);
    result.set_reason("no execution outcome");
    return result;
  }
  result.set_outcome(outcome->outcome);
  result.set_stdout_data(outcome->stdout_data);
  result.set_stderr_data(outcome->stderr_data);
  result.set_stdout_truncated(outcome->stdout_truncated);
  result.set_stderr_truncated(outcome->stderr_truncated);
  result.set_truncated(outcome->stdout_truncated || outcome->stderr_truncated);
  if (outcome->has_exit_code) result.set_exit_code(outcome->exit_code);
  result.set_signal(outcome->signal);
  result.set_duration_ms(outcome->duration_ms);
  result.set_cpu_time_ms(outcome->cpu_time_ms);
  result.set_memory_usage_kb(outcome->memory_usage_kb);
  result.set_reason(outcome->reason);
  return result;
}

}  // namespace executor
