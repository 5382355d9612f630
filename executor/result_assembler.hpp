#ifndef EXECUTOR_RESULT_ASSEMBLER_HPP
#define EXECUTOR_RESULT_ASSEMBLER_HPP

#include "executor/runner.hpp"
#include "proto/codebox.pb.h"

namespace executor {

// Builds the result returned to the caller. If violation is not null the
// program was never run and the result is REJECTED_BY_POLICY, otherwise the
// outcome is copied as-is. With neither of them the result is an
// INTERNAL_ERROR.
proto::ExecutionResult AssembleResult(const proto::PolicyViolation* violation,
                                      const RunnerOutcome* outcome);

}  // namespace executor

#endif
