#include "executor/runner.hpp"

#include <signal.h>

#include <algorithm>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace executor {

namespace {
const constexpr char* kStdinFile = "stdin";
}  // namespace

Interpreter InterpreterFromFlags() {
  Interpreter interpreter;
  interpreter.language = FLAGS_language;
  interpreter.executable = util::which(FLAGS_interpreter);
  if (interpreter.executable.empty()) {
    throw std::runtime_error("Interpreter not found: " + FLAGS_interpreter);
  }
  std::vector<std::string> args =
      absl::StrSplit(FLAGS_interpreter_args, ',', absl::SkipWhitespace());
  interpreter.args = std::move(args);
  interpreter.env = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8",
                     "PYTHONIOENCODING=utf-8"};
  interpreter.source_file = "main.py";
  interpreter.out_of_memory_marker = FLAGS_out_of_memory_marker;
  return interpreter;
}

RunnerOutcome Classify(sandbox::ExecutionInfo info,
                       const proto::ExecutionLimits& limits,
                       const std::string& out_of_memory_marker) {
  RunnerOutcome outcome;
  outcome.stdout_data = std::move(info.stdout_data);
  outcome.stderr_data = std::move(info.stderr_data);
  outcome.stdout_truncated = info.stdout_truncated;
  outcome.stderr_truncated = info.stderr_truncated;
  outcome.signal = info.signal;
  outcome.has_exit_code = !info.killed && info.signal == 0;
  outcome.exit_code = outcome.has_exit_code ? info.status_code : 0;
  outcome.duration_ms = info.wall_time_millis;
  outcome.cpu_time_ms = info.cpu_time_millis + info.sys_time_millis;
  outcome.memory_usage_kb = info.memory_usage_kb;

  bool failed = info.signal != 0 || info.status_code != 0;
  if (info.killed) {
    outcome.outcome = proto::TIMED_OUT;
    outcome.reason = "Wall limit exceeded";
  } else if (info.signal == SIGXCPU ||
             (info.signal == SIGKILL &&
              outcome.cpu_time_ms >= limits.max_cpu_seconds() * 1000)) {
    outcome.outcome = proto::TIMED_OUT;
    outcome.reason = "CPU limit exceeded";
  } else if (info.signal == SIGKILL) {
    outcome.outcome = proto::MEMORY_EXCEEDED;
    outcome.reason = "Killed by the system, probably out of memory";
  } else if (limits.max_memory_bytes() &&
             info.memory_usage_kb * 1024 >= limits.max_memory_bytes()) {
    outcome.outcome = proto::MEMORY_EXCEEDED;
    outcome.reason = "Memory limit exceeded";
  } else if (failed && !out_of_memory_marker.empty() &&
             absl::StrContains(info.stderr_tail, out_of_memory_marker)) {
    outcome.outcome = proto::MEMORY_EXCEEDED;
    outcome.reason = "Memory limit exceeded";
  } else {
    outcome.outcome = proto::COMPLETED;
    outcome.reason = info.message;
  }
  return outcome;
}

Runner::Runner(Interpreter interpreter, SandboxFactory sandbox_factory)
    : interpreter_(std::move(interpreter)),
      sandbox_factory_(std::move(sandbox_factory)) {}

RunnerOutcome Runner::Run(const std::string& code,
                          const std::string* input_data,
                          const proto::ExecutionLimits& limits) const {
  return Run(code, input_data, limits,
             std::chrono::steady_clock::now() +
                 std::chrono::seconds(limits.max_wall_seconds()));
}

RunnerOutcome Runner::Run(const std::string& code,
                          const std::string* input_data,
                          const proto::ExecutionLimits& limits,
                          Deadline deadline) const {
  util::TempDir tmp(FLAGS_temp_directory);
  if (FLAGS_keep_sandboxes) tmp.Keep();

  std::string program =
      util::File::JoinPath(tmp.Path(), interpreter_.source_file);
  util::File::Write(program, code);

  // Folder and arguments.
  sandbox::ExecutionOptions exec_options(tmp.Path(), interpreter_.executable);
  exec_options.args = interpreter_.args;
  exec_options.args.push_back(interpreter_.source_file);
  exec_options.env = interpreter_.env;
  exec_options.env.push_back("HOME=" + tmp.Path());

  std::vector<std::string> input_files = {program};
  if (input_data != nullptr) {
    exec_options.stdin_file = util::File::JoinPath(tmp.Path(), kStdinFile);
    util::File::Write(exec_options.stdin_file, *input_data);
    input_files.push_back(exec_options.stdin_file);
  }

  // Limits. The wall time budget may have been partially used while waiting
  // for a free slot.
  int64_t remaining_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now())
          .count();
  exec_options.cpu_limit_millis = limits.max_cpu_seconds() * 1000;
  exec_options.wall_limit_millis =
      std::max<int64_t>(1, std::min<int64_t>(limits.max_wall_seconds() * 1000,
                                             remaining_millis));
  exec_options.memory_limit_kb = limits.max_memory_bytes() / 1024;
  exec_options.max_output_bytes = limits.max_output_bytes();
  exec_options.max_procs = FLAGS_max_processes;
  exec_options.max_files = FLAGS_max_files;
  exec_options.max_file_size_kb = FLAGS_max_file_size_kb;
  exec_options.kill_grace_millis = FLAGS_kill_grace_millis;

  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox_factory_();
  if (!sb) throw execution_failed("No sandbox available");
  for (const std::string& input_file : input_files) {
    if (!sb->MakeImmutable(input_file, &error_msg)) {
      throw execution_failed(error_msg);
    }
  }

  // Actual execution.
  sandbox::ExecutionInfo info;
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    throw execution_failed(error_msg);
  }
  VLOG(1) << "Program in " << tmp.Path() << " exited with status "
          << info.status_code << ", signal " << info.signal << " after "
          << info.wall_time_millis << "ms";
  return Classify(std::move(info), limits, interpreter_.out_of_memory_marker);
}

}  // namespace executor
