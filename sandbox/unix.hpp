#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/resource.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. The program runs in a new
// session with kernel resource limits, its output is collected from pipes and
// it is killed, together with its process group, when the wall time limit
// expires. Processes that leave the session are not tracked: used only when
// isolation is disabled with --noisolate.
class Unix : public Sandbox {
 public:
  bool MakeImmutable(const std::string& path, std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score();
  ~Unix() override;

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Creates the pipes, opens the
  // standard input and prepares everything the child needs, since the child
  // must not allocate memory. Returns false and sets error_msg if setup
  // fails.
  bool Setup(std::string* error_msg);

  // Hook executed at the end of Setup, in the parent.
  virtual bool Prepare(std::string* /*error_msg*/) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Reports an error of the child process to the parent, and exits.
  [[noreturn]] void Die(const char* prefix, const char* error);
  [[noreturn]] void DieErrno(const char* prefix, int err);

  // Hook that is executed just before exec. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* /*error_msg*/, size_t /*buflen*/) { return true; }

  // Collects the output of the child and waits for its termination, killing
  // it if it exceeds the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Sends SIGKILL to the process group of the child and waits for it to be
  // reaped, for at most kill_grace_millis.
  bool KillAndReap(int* child_status, struct rusage* rusage,
                   std::string* error_msg);

  // Executed when the child program exits. May change the execution info with
  // "better" values. Returns false and sets error_msg if the result of the
  // program cannot be known.
  virtual bool OnFinish(ExecutionInfo* /*info*/, std::string* /*error_msg*/) {
    return true;
  }

  // Executed after every execution, successful or not.
  virtual void Cleanup() {}

  // Returns "prefix: " followed by the description of err. Not for use in
  // the child process.
  static std::string ErrorMessage(const char* prefix, int err);

  // Sets the message of info from its status code and signal.
  static void DescribeStatus(ExecutionInfo* info);

  void CloseFds();

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  int stdin_fd_ = -1;
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  // Folder the program starts in.
  std::string working_dir_;

  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
