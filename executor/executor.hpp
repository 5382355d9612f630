#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <stdexcept>
#include <string>

#include "proto/codebox.pb.h"

namespace executor {

// The request asks for a language this executor does not run.
class unsupported_language : public std::invalid_argument {
 public:
  explicit unsupported_language(const std::string& msg)
      : std::invalid_argument(msg) {}
};

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Executes a request and returns its result. Policy rejections and
  // resource limit violations are reported in the result. Throws
  // unsupported_language, too_many_executions if there is no capacity left
  // and execution_failed if the program could not be supervised.
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) = 0;

  // Current configuration and load of the executor.
  virtual proto::HealthResponse Health() = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
