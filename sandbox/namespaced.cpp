#include "sandbox/namespaced.hpp"

#include <errno.h>
#include <string.h>

#ifdef __linux__
#include <fcntl.h>
#include <limits.h>
#include <mntent.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace sandbox {

#ifdef __linux__
namespace {
const constexpr int kNamespaces = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS |
                                  CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
const constexpr size_t kStackSize = 256 * 1024;
const constexpr size_t kCheckStackSize = 64 * 1024;

// User the program runs as inside the namespace ("nobody"). It is mapped to
// the user of the server.
const constexpr unsigned kProgramId = 65534;
const constexpr char* kHostname = "sandbox";
const constexpr char* kOldRoot = ".old_root";
const constexpr char* kDevices[] = {"/dev/null", "/dev/zero", "/dev/random",
                                    "/dev/urandom"};

bool WriteFile(const char* path, const char* data) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return false;
  size_t len = strlen(data);
  ssize_t written = 0;
  do {
    written = write(fd, data, len);
  } while (written == -1 && errno == EINTR);
  int err = errno;
  close(fd);
  errno = err;
  return written == static_cast<ssize_t>(len);
}

unsigned long RemountFlags(const struct statvfs& vfs) {  // NOLINT
  unsigned long flags = 0;                                // NOLINT
  if (vfs.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (vfs.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (vfs.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (vfs.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (vfs.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (vfs.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  return flags;
}

// Everything the sandbox needs from the kernel, in a throwaway process.
int CheckMain(void* /*unused*/) {
  if (mount(nullptr, "/", nullptr, MS_REC | MS_SLAVE, nullptr) == -1) {
    return 1;
  }
  if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "size=64k") ==
      -1) {
    return 1;
  }
  return 0;
}
}  // namespace

int Namespaced::Score() { return FLAGS_isolate ? 3 : -1; }

bool Namespaced::Supported() {
  std::vector<char> stack(kCheckStackSize);
  pid_t pid = clone(&CheckMain, stack.data() + stack.size(),
                    kNamespaces | SIGCHLD, nullptr);
  if (pid == -1) return false;
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

Namespaced::~Namespaced() { Cleanup(); }

void Namespaced::AddMountPoint(MountPoint::Kind kind, const std::string& source,
                               const std::string& path, bool read_only,
                               unsigned long remount_flags) {  // NOLINT
  planned_paths_.insert(path);
  mount_points_.push_back(
      MountPoint{kind, source, new_root_ + path, read_only, remount_flags});
}

void Namespaced::AddParents(const std::string& path) {
  for (size_t pos = path.find('/', 1); pos != std::string::npos;
       pos = path.find('/', pos + 1)) {
    std::string parent = path.substr(0, pos);
    if (planned_paths_.count(parent)) continue;
    AddMountPoint(MountPoint::kDirectory, "", parent, false, 0);
  }
}

bool Namespaced::AddReadOnlyPath(const std::string& path,
                                 std::string* error_msg) {
  struct stat st {};
  if (lstat(path.c_str(), &st) == -1) {
    if (errno == ENOENT) return true;
    *error_msg = ErrorMessage(("lstat " + path).c_str(), errno);
    return false;
  }
  AddParents(path);
  if (S_ISLNK(st.st_mode)) {
    char link[PATH_MAX] = {};
    ssize_t len = readlink(path.c_str(), link, sizeof(link) - 1);
    if (len == -1) {
      *error_msg = ErrorMessage(("readlink " + path).c_str(), errno);
      return false;
    }
    AddMountPoint(MountPoint::kSymlink, std::string(link, len), path, false,
                  0);
    return true;
  }
  struct statvfs vfs {};
  if (statvfs(path.c_str(), &vfs) == -1) {
    *error_msg = ErrorMessage(("statvfs " + path).c_str(), errno);
    return false;
  }
  AddMountPoint(S_ISDIR(st.st_mode) ? MountPoint::kDirectory
                                    : MountPoint::kFile,
                path, path, true, RemountFlags(vfs));

  // Mounts below path come along with the bind, writable if they were.
  FILE* mounts = setmntent("/proc/self/mounts", "r");
  if (mounts == nullptr) {
    *error_msg = ErrorMessage("setmntent", errno);
    return false;
  }
  std::string prefix = path.back() == '/' ? path : path + "/";
  while (struct mntent* ent = getmntent(mounts)) {
    if (!absl::StartsWith(ent->mnt_dir, prefix)) continue;
    // Without the flags the remount fails if some of them are locked.
    unsigned long flags = 0;  // NOLINT
    if (statvfs(ent->mnt_dir, &vfs) == 0) flags = RemountFlags(vfs);
    AddMountPoint(MountPoint::kRemount, "", ent->mnt_dir, true, flags);
  }
  endmntent(mounts);
  return true;
}

bool Namespaced::Prepare(std::string* error_msg) {
  char real_root[PATH_MAX] = {};
  if (realpath(options_->root.c_str(), real_root) == nullptr) {
    *error_msg = ErrorMessage("realpath", errno);
    return false;
  }
  working_dir_ = real_root;
  new_root_ = working_dir_ + ".root";
  if (mkdir(new_root_.c_str(), 0700) == -1 && errno != EEXIST) {
    *error_msg = ErrorMessage("mkdir", errno);
    new_root_.clear();
    return false;
  }
  uid_map_ = std::to_string(kProgramId) + " " + std::to_string(getuid()) +
             " 1\n";
  gid_map_ = std::to_string(kProgramId) + " " + std::to_string(getgid()) +
             " 1\n";

  mount_points_.clear();
  planned_paths_.clear();
  for (absl::string_view path : absl::StrSplit(
           FLAGS_sandbox_readonly_paths, ',', absl::SkipWhitespace())) {
    if (!AddReadOnlyPath(std::string(path), error_msg)) return false;
  }
  for (const char* device : kDevices) {
    AddParents(device);
    AddMountPoint(MountPoint::kFile, device, device, false, 0);
  }
  AddParents(working_dir_);
  AddMountPoint(MountPoint::kDirectory, working_dir_, working_dir_, false, 0);

  init_stack_.resize(kStackSize);
  program_stack_.resize(kStackSize);
  if (pipe2(status_fds_, O_CLOEXEC) == -1) {
    *error_msg = ErrorMessage("pipe2", errno);
    return false;
  }
  return true;
}

bool Namespaced::DoFork(std::string* error_msg) {
  pid_t pid = clone(&Namespaced::InitMain,
                    init_stack_.data() + init_stack_.size(),
                    kNamespaces | SIGCHLD, this);
  if (pid == -1) {
    *error_msg = ErrorMessage("clone", errno);
    return false;
  }
  child_pid_ = pid;
  close(status_fds_[1]);
  status_fds_[1] = -1;
  return true;
}

int Namespaced::InitMain(void* sandbox) {
  static_cast<Namespaced*>(sandbox)->Init();
}

int Namespaced::ProgramMain(void* sandbox) {
  static_cast<Namespaced*>(sandbox)->Child();
}

void Namespaced::Init() {
  // Our process group still belongs to the server.
  if (setpgid(0, 0) == -1) DieErrno("setpgid", errno);
  if (mount(nullptr, "/", nullptr, MS_REC | MS_SLAVE, nullptr) == -1) {
    DieErrno("mount /", errno);
  }
  if (!WriteFile("/proc/self/setgroups", "deny") && errno != ENOENT) {
    DieErrno("setgroups", errno);
  }
  if (!WriteFile("/proc/self/uid_map", uid_map_.c_str())) {
    DieErrno("uid_map", errno);
  }
  if (!WriteFile("/proc/self/gid_map", gid_map_.c_str())) {
    DieErrno("gid_map", errno);
  }
  if (sethostname(kHostname, strlen(kHostname)) == -1) {
    DieErrno("sethostname", errno);
  }
  MountRoot();

  pid_t program =
      clone(&Namespaced::ProgramMain,
            program_stack_.data() + program_stack_.size(), SIGCHLD, this);
  if (program == -1) DieErrno("clone", errno);
  for (int fd : {pipe_fds_[0], pipe_fds_[1], stdout_fds_[0], stdout_fds_[1],
                 stderr_fds_[0], stderr_fds_[1], stdin_fd_, status_fds_[0]}) {
    close(fd);
  }

  // Processes of the namespace whose parent died are reparented to init.
  int status = 0;
  while (true) {
    int wstatus = 0;
    pid_t pid = waitpid(-1, &wstatus, 0);
    if (pid == -1 && errno == EINTR) continue;
    if (pid == -1) _exit(1);
    if (pid == program) {
      status = wstatus;
      break;
    }
  }
  ssize_t written = 0;
  do {
    written = write(status_fds_[1], &status, sizeof(status));
  } while (written == -1 && errno == EINTR);
  // Exiting kills whatever is left in the namespace.
  _exit(written == sizeof(status) ? 0 : 1);
}

void Namespaced::MountRoot() {
  if (mount("tmpfs", new_root_.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
            "size=1m,mode=0755") == -1) {
    DieErrno("mount tmpfs", errno);
  }
  for (const MountPoint& point : mount_points_) {
    const char* target = point.target.c_str();
    switch (point.kind) {
      case MountPoint::kSymlink:
        if (symlink(point.source.c_str(), target) == -1) {
          DieErrno("symlink", errno);
        }
        continue;
      case MountPoint::kDirectory:
        if (mkdir(target, 0755) == -1 && errno != EEXIST) {
          DieErrno("mkdir", errno);
        }
        break;
      case MountPoint::kFile: {
        int fd = open(target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd == -1) DieErrno("create", errno);
        close(fd);
        break;
      }
      case MountPoint::kRemount:
        break;
    }
    if (point.kind != MountPoint::kRemount) {
      if (point.source.empty()) continue;
      unsigned long flags = MS_BIND;  // NOLINT
      // Read-only folders may hold locked mounts, which only move together.
      if (point.read_only) flags |= MS_REC;
      if (mount(point.source.c_str(), target, nullptr, flags, nullptr) == -1) {
        DieErrno("bind", errno);
      }
    }
    if (point.read_only &&
        mount(nullptr, target, nullptr,
              MS_BIND | MS_REMOUNT | MS_RDONLY | point.remount_flags,
              nullptr) == -1) {
      DieErrno("remount", errno);
    }
  }

  if (chdir(new_root_.c_str()) == -1) DieErrno("chdir", errno);
  if (mkdir(kOldRoot, 0700) == -1) DieErrno("mkdir", errno);
  // pivot_root has no wrapper in libc.
  if (syscall(SYS_pivot_root, ".", kOldRoot) == -1) {
    DieErrno("pivot_root", errno);
  }
  if (chroot(".") == -1) DieErrno("chroot", errno);
  if (umount2(kOldRoot, MNT_DETACH) == -1) DieErrno("umount2", errno);
  if (rmdir(kOldRoot) == -1) DieErrno("rmdir", errno);
  if (mount(nullptr, "/", nullptr,
            MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1) {
    DieErrno("remount /", errno);
  }
}

bool Namespaced::OnChild(char* /*error_msg*/, size_t /*buflen*/) {
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    DieErrno("prctl", errno);
  }
  return true;
}

bool Namespaced::OnFinish(ExecutionInfo* info, std::string* error_msg) {
  int status = 0;
  ssize_t num_read = 0;
  do {
    num_read = read(status_fds_[0], &status, sizeof(status));
  } while (num_read == -1 && errno == EINTR);
  if (num_read != sizeof(status)) {
    // Init was killed at the wall time limit, the program with it.
    if (info->killed) return true;
    *error_msg = "init exited without the status of the program";
    return false;
  }
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  DescribeStatus(info);
  return true;
}

void Namespaced::Cleanup() {
  for (int& fd : status_fds_) {
    if (fd != -1) close(fd);
    fd = -1;
  }
  if (new_root_.empty()) return;
  if (rmdir(new_root_.c_str()) == -1 && errno != ENOENT) {
    LOG(WARNING) << ErrorMessage(("rmdir " + new_root_).c_str(), errno);
  }
  new_root_.clear();
}

#else

int Namespaced::Score() { return -1; }

bool Namespaced::Supported() { return false; }

Namespaced::~Namespaced() = default;

bool Namespaced::Prepare(std::string* error_msg) {
  *error_msg = "namespaces are not supported";
  return false;
}

bool Namespaced::DoFork(std::string* error_msg) {
  *error_msg = "namespaces are not supported";
  return false;
}

bool Namespaced::OnChild(char* /*error_msg*/, size_t /*buflen*/) {
  return false;
}

bool Namespaced::OnFinish(ExecutionInfo* /*info*/, std::string* error_msg) {
  *error_msg = "namespaces are not supported";
  return false;
}

void Namespaced::Cleanup() {}

#endif

namespace {
Sandbox::Register<Namespaced> r;  // NOLINT
}  // namespace

}  // namespace sandbox
