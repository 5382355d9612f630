#include "executor/local_executor.hpp"

#include <chrono>
#include <system_error>
#include <thread>

#include "executor/code_preparer.hpp"
#include "executor/limits.hpp"
#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace executor {

namespace {
const constexpr char* kHealthy = "healthy";

size_t NumRunning(size_t max_running) {
  if (max_running != 0) return max_running;
  size_t cores = std::thread::hardware_concurrency();
  return cores == 0 ? 1 : cores;
}
}  // namespace

LocalExecutor::LocalExecutor(policy::PolicyFilter filter, Runner runner,
                             proto::ExecutionLimits limits, size_t max_running,
                             size_t max_queued, bool echo_last_expression)
    : filter_(std::move(filter)),
      runner_(std::move(runner)),
      limits_(std::move(limits)),
      admission_(NumRunning(max_running), max_queued),
      echo_last_expression_(echo_last_expression) {
  ValidateLimits(limits_);
}

std::unique_ptr<LocalExecutor> LocalExecutor::FromFlags() {
  if (FLAGS_max_concurrent_executions < 0 || FLAGS_max_queued_executions < 0) {
    throw invalid_limits("The number of executions must not be negative");
  }
  policy::PolicyFilter filter(policy::RulesFromFlags(), FLAGS_max_code_bytes);
  return std::make_unique<LocalExecutor>(
      std::move(filter), Runner(InterpreterFromFlags()), LimitsFromFlags(),
      FLAGS_max_concurrent_executions, FLAGS_max_queued_executions,
      FLAGS_echo_last_expression);
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request) {
  const std::string& language = runner_.GetInterpreter().language;
  if (!request.language().empty() && request.language() != language) {
    LOG(INFO) << "Rejected request for language " << request.language();
    throw unsupported_language("Language '" + request.language() +
                               "' is not supported. Only '" + language +
                               "' is supported.");
  }

  proto::PolicyViolation violation;
  if (!filter_.Check(request.code(), &violation)) {
    LOG(INFO) << "Rejected by policy: " << policy::Describe(violation);
    return AssembleResult(&violation, nullptr);
  }

  std::string code = request.code();
  if (echo_last_expression_) code = PrepareCode(code);
  const std::string* input_data =
      request.has_input_data() ? &request.input_data() : nullptr;

  // The wall time budget starts when the request is queued.
  Runner::Deadline deadline = std::chrono::steady_clock::now() +
                              std::chrono::seconds(limits_.max_wall_seconds());
  RunnerOutcome outcome;
  try {
    Admission::Slot slot(&admission_, deadline);
    outcome = runner_.Run(code, input_data, limits_, deadline);
  } catch (too_many_executions& e) {
    LOG(WARNING) << e.what();
    throw;
  } catch (execution_failed& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    throw;
  } catch (std::system_error& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    throw execution_failed(e.what());
  } catch (std::runtime_error& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    throw execution_failed(e.what());
  }

  proto::ExecutionResult result = AssembleResult(nullptr, &outcome);
  LOG(INFO) << "Executed " << request.code().size() << " bytes: "
            << proto::Outcome_Name(result.outcome()) << " in "
            << result.duration_ms() << "ms";
  return result;
}

proto::HealthResponse LocalExecutor::Health() {
  proto::HealthResponse response;
  response.set_status(kHealthy);
  response.set_language(runner_.GetInterpreter().language);
  *response.mutable_limits() = limits_;
  response.set_max_concurrent_executions(admission_.MaxRunning());
  response.set_running_executions(admission_.Running());
  response.set_queued_executions(admission_.Queued());
  return response;
}

}  // namespace executor
