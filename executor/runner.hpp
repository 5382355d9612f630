#ifndef EXECUTOR_RUNNER_HPP
#define EXECUTOR_RUNNER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/codebox.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// The program could not be run or supervised: spawn, setup or reap failure.
class execution_failed : public std::runtime_error {
 public:
  explicit execution_failed(const std::string& msg)
      : std::runtime_error(msg) {}
};

// How programs of the supported language are started.
struct Interpreter {
  std::string language;
  std::string executable;
  std::vector<std::string> args;
  std::vector<std::string> env;
  // Name of the program file inside the sandbox folder.
  std::string source_file;
  // Text the interpreter prints on stderr when an allocation fails.
  std::string out_of_memory_marker;
};

// The interpreter configured by --language, --interpreter,
// --interpreter_args and --out_of_memory_marker. Throws std::runtime_error
// if the interpreter cannot be found.
Interpreter InterpreterFromFlags();

// What happened to a program that was run.
struct RunnerOutcome {
  proto::Outcome outcome = proto::INTERNAL_ERROR;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  bool has_exit_code = false;
  int32_t exit_code = 0;
  int32_t signal = 0;
  int64_t duration_ms = 0;
  int64_t cpu_time_ms = 0;
  int64_t memory_usage_kb = 0;
  std::string reason;
};

// Maps the termination of a program to an outcome: killed at the wall time
// limit or by SIGXCPU is TIMED_OUT, killed by the system, over the memory
// limit or failing with out_of_memory_marker on stderr is MEMORY_EXCEEDED,
// anything else is COMPLETED.
RunnerOutcome Classify(sandbox::ExecutionInfo info,
                       const proto::ExecutionLimits& limits,
                       const std::string& out_of_memory_marker);

// Runs a program in a fresh sandbox folder, with the given limits.
class Runner {
 public:
  using SandboxFactory = std::function<std::unique_ptr<sandbox::Sandbox>()>;
  using Deadline = std::chrono::steady_clock::time_point;

  explicit Runner(Interpreter interpreter,
                  SandboxFactory sandbox_factory = &sandbox::Sandbox::Create);

  // Runs code with input_data (if not null) on its standard input. Throws
  // execution_failed if the program could not be run.
  RunnerOutcome Run(const std::string& code, const std::string* input_data,
                    const proto::ExecutionLimits& limits) const;

  // Same as above, but the wall time limit ends at deadline if that comes
  // first.
  RunnerOutcome Run(const std::string& code, const std::string* input_data,
                    const proto::ExecutionLimits& limits,
                    Deadline deadline) const;

  const Interpreter& GetInterpreter() const { return interpreter_; }

 private:
  Interpreter interpreter_;
  SandboxFactory sandbox_factory_;
};

}  // namespace executor

#endif
