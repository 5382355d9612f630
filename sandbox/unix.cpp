#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"
#include "util/flags.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kReadBufSize = 64 * 1024;
static const constexpr size_t kStderrTailSize = 4096;
static const constexpr int64_t kPollIntervalMillis = 10;

// Both ends are close-on-exec. On Linux the flag is set atomically, so that a
// program started by another thread never inherits the pipe.
int MakePipe(int fds[2]) {
#ifdef __linux__
  return pipe2(fds, O_CLOEXEC);
#else
  if (pipe(fds) == -1) return -1;
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    return -1;
  }
  return 0;
#endif
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool WriteAll(int fd, const void* data, size_t len) {
  const char* buf = static_cast<const char*>(data);
  while (len > 0) {
    ssize_t written = write(fd, buf, len);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return false;
    buf += written;
    len -= written;
  }
  return true;
}

// Reads everything that is currently available on fd. Bytes past limit (if
// limit is not 0) are read and dropped, and *truncated is set. Returns false
// once the write end of the pipe has been closed.
bool DrainPipe(int fd, int64_t limit, std::string* data, bool* truncated,
               std::string* tail) {
  char buf[kReadBufSize];
  while (true) {
    ssize_t amount = read(fd, buf, kReadBufSize);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) return errno == EAGAIN || errno == EWOULDBLOCK;
    if (amount == 0) return false;
    size_t keep = amount;
    if (limit > 0) {
      size_t room = data->size() < static_cast<size_t>(limit)
                        ? static_cast<size_t>(limit) - data->size()
                        : 0;
      if (keep > room) {
        keep = room;
        *truncated = true;
      }
    }
    data->append(buf, keep);
    if (tail != nullptr) {
      tail->append(buf, amount);
      if (tail->size() > kStderrTailSize) {
        tail->erase(0, tail->size() - kStderrTailSize);
      }
    }
  }
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] != -1) close(fds[i]);
    fds[i] = -1;
  }
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

int Unix::Score() { return FLAGS_isolate ? -1 : 2; }

Unix::~Unix() { CloseFds(); }

bool Unix::MakeImmutable(const std::string& path, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (chmod(path.c_str(), S_IRUSR) == -1) {
    *error_msg = "chmod: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  CloseFds();
  Cleanup();
  return ok;
}

void Unix::CloseFds() {
  ClosePipe(pipe_fds_);
  ClosePipe(stdout_fds_);
  ClosePipe(stderr_fds_);
  if (stdin_fd_ != -1) close(stdin_fd_);
  stdin_fd_ = -1;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (MakePipe(pipe_fds_) == -1 || MakePipe(stdout_fds_) == -1 ||
      MakePipe(stderr_fds_) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (!SetNonBlocking(stdout_fds_[0]) || !SetNonBlocking(stderr_fds_[0])) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  const char* stdin_file = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  stdin_fd_ = open(stdin_file, O_RDONLY | O_CLOEXEC);
  if (stdin_fd_ == -1) {
    *error_msg = "open: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  working_dir_ = options_->root;

  // Prepare args and environment.
  auto add = [](std::vector<std::vector<char>>* storage,
                const std::string& s) {
    storage->emplace_back(s.begin(), s.end());
    storage->back().push_back(0);
  };
  arg_storage_.clear();
  env_storage_.clear();
  add(&arg_storage_, options_->executable);
  for (const std::string& arg : options_->args) add(&arg_storage_, arg);
  for (const std::string& var : options_->env) add(&env_storage_, var);
  argv_.clear();
  envp_.clear();
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  for (std::vector<char>& var : env_storage_) envp_.push_back(var.data());
  envp_.push_back(nullptr);
  return Prepare(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Die(const char* prefix, const char* error) {
  char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
  strncat(buf, prefix, 64);
  strncat(buf, ": ", 3);
  strncat(buf, error, kStrErrorBufSize);
  ssize_t len = strlen(buf);
  if (WriteAll(pipe_fds_[1], &len, sizeof(len))) {
    WriteAll(pipe_fds_[1], buf, len);
  }
  close(pipe_fds_[1]);
  _Exit(1);
}

void Unix::DieErrno(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  Die(prefix, mystrerror(err, buf, kStrErrorBufSize));
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);

  // Change session and process group, so that we do not receive Ctrl-Cs in
  // the terminal and the whole group can be killed at once.
  if (setsid() == -1) DieErrno("setsid", errno);

  if (chdir(working_dir_.c_str()) == -1) {
    DieErrno("chdir", errno);
  }

  // Handle I/O redirection.
  if (dup2(stdin_fd_, STDIN_FILENO) == -1) DieErrno("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) {
    DieErrno("redir stdout", errno);
  }
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) {
    DieErrno("redir stderr", errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        DieErrno("setrlim " #res, errno);       \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM

  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) DieErrno("setrlim CORE", errno);

  // The soft limit delivers SIGXCPU, the hard one a second later SIGKILL.
  if (options_->cpu_limit_millis) {
    rlim.rlim_cur = (options_->cpu_limit_millis + 999) / 1000;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) DieErrno("setrlim CPU", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    Die("OnChild", buf);
  }
  execve(options_->executable.c_str(), argv_.data(), envp_.data());
  DieErrno("exec", errno);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char errbuf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  close(stdout_fds_[1]);
  close(stderr_fds_[1]);
  pipe_fds_[1] = stdout_fds_[1] = stderr_fds_[1] = -1;

  ssize_t error_len = 0;
  ssize_t num_read = 0;
  do {
    num_read = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (num_read == -1 && errno == EINTR);
  if (num_read == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<ssize_t>(error_len, PIPE_BUF - 1);
    ssize_t got = 0;
    while (got < error_len) {
      ssize_t cur = read(pipe_fds_[0], error + got, error_len - got);
      if (cur == -1 && errno == EINTR) continue;
      if (cur <= 0) break;
      got += cur;
    }
    *error_msg = error;
    // The child exits right after reporting the error.
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1) {
      if (errno == EINTR) continue;
      *error_msg += "; waitpid: ";
      *error_msg += mystrerror(errno, errbuf, kStrErrorBufSize);
      break;
    }
    return false;
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  bool stdout_open = true;
  bool stderr_open = true;
  auto drain = [&](int fd, bool* open) {
    if (fd == stdout_fds_[0]) {
      *open = DrainPipe(fd, options_->max_output_bytes, &info->stdout_data,
                        &info->stdout_truncated, nullptr);
    } else {
      *open = DrainPipe(fd, options_->max_output_bytes, &info->stderr_data,
                        &info->stderr_truncated, &info->stderr_tail);
    }
  };

  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (true) {
    int64_t timeout = kPollIntervalMillis;
    if (options_->wall_limit_millis) {
      int64_t remaining = options_->wall_limit_millis - elapsed_millis();
      if (remaining <= 0) break;
      timeout = std::min(timeout, remaining);
    }
    struct pollfd fds[2] = {};
    int nfds = 0;
    if (stdout_open) fds[nfds++] = {stdout_fds_[0], POLLIN, 0};
    if (stderr_open) fds[nfds++] = {stderr_fds_[0], POLLIN, 0};
    if (nfds == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout));
    } else if (poll(fds, nfds, timeout) > 0) {
      for (int i = 0; i < nfds; i++) {
        if (!fds[i].revents) continue;
        drain(fds[i].fd,
              fds[i].fd == stdout_fds_[0] ? &stdout_open : &stderr_open);
      }
    }
    pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    if (ret == -1 && errno != EINTR) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, errbuf, kStrErrorBufSize);
      std::string kill_error;
      if (!KillAndReap(&child_status, &rusage, &kill_error)) {
        *error_msg += "; " + kill_error;
      }
      return false;
    }
  }
  if (!has_exited) {
    info->killed = true;
    if (!KillAndReap(&child_status, &rusage, error_msg)) return false;
  } else if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    // Processes left behind in the session could keep the pipes open.
    LOG(WARNING) << "kill: " << mystrerror(errno, errbuf, kStrErrorBufSize);
  }
  if (stdout_open) drain(stdout_fds_[0], &stdout_open);
  if (stderr_open) drain(stderr_fds_[0], &stderr_open);

  info->memory_usage_kb = rusage.ru_maxrss;
#ifdef __APPLE__
  info->memory_usage_kb /= 1024;
#endif
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  DescribeStatus(info);
  return OnFinish(info, error_msg);
}

std::string Unix::ErrorMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  std::string message = prefix;
  message += ": ";
  message += mystrerror(err, buf, kStrErrorBufSize);
  return message;
}

void Unix::DescribeStatus(ExecutionInfo* info) {
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  } else {
    info->message.clear();
  }
}

bool Unix::KillAndReap(int* child_status, struct rusage* rusage,
                       std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1 &&
      errno != ESRCH) {
    *error_msg = "kill: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  auto kill_time = std::chrono::steady_clock::now();
  while (true) {
    pid_t ret = wait4(child_pid_, child_status, WNOHANG, rusage);
    if (ret == child_pid_) return true;
    if (ret == -1 && errno != EINTR) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    if (std::chrono::steady_clock::now() - kill_time >
        std::chrono::milliseconds(options_->kill_grace_millis)) {
      *error_msg = "wait4: program " + std::to_string(child_pid_) +
                   " still running after SIGKILL";
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
