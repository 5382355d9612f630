#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values, 0 means unlimited.
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_output_bytes = 0;
  // Processes and threads of the user the program runs as.
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  // How long to wait for the program to disappear after SIGKILL.
  int64_t kill_grace_millis = 2000;

  // If empty, the program reads from /dev/null.
  std::string stdin_file = "";
  std::vector<std::string> args;
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the sandbox killed the program because of the wall time limit.
  bool killed = false;

  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  // Last bytes written on stderr, including the ones past max_output_bytes.
  std::string stderr_tail;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Makes a file read-only for the program. Returns false on error, and
  // sets error_msg.
  virtual bool MakeImmutable(const std::string& /*path*/,
                             std::string* /*error_msg*/) {
    return true;
  }

  // Runs the specified command. Returns true if the program was started and
  // reaped, and sets fields in info. Otherwise, returns false and sets
  // error_msg. A sandbox instance runs a single program at a time.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
