#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP
#include <set>
#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox that runs the program in new user, PID, mount, network, IPC
// and UTS namespaces. The child of the server is the init process of the PID
// namespace: it starts the program and waits for it, and every other process
// of the namespace is killed by the kernel when init exits, even if it left
// the session of the program.
//
// The program runs as an unprivileged user. It sees a read-only root with the
// paths in --sandbox_readonly_paths, /dev/null, /dev/zero, /dev/random and
// /dev/urandom, and its own folder, which is the only writable place. Its
// network namespace has nothing but a loopback interface that is down.
//
// Selected by --isolate, which is the default. There is no fallback: if the
// namespaces cannot be created the execution fails.
class Namespaced : public Unix {
 public:
  static Sandbox* Create() { return new Namespaced(); }
  static int Score();
  // Whether this process can create the namespaces and mount in them.
  static bool Supported();
  ~Namespaced() override;

 protected:
  Namespaced() = default;
  bool Prepare(std::string* error_msg) override;
  bool DoFork(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  bool OnFinish(ExecutionInfo* info, std::string* error_msg) override;
  void Cleanup() override;

 private:
  // Something to create in the new root, possibly with a host path mounted
  // on it.
  struct MountPoint {
    enum Kind { kDirectory, kFile, kSymlink, kRemount };
    Kind kind;
    // Host path to bind, or contents of the symlink. Empty for folders that
    // only hold other mount points.
    std::string source;
    std::string target;
    bool read_only;
    // Flags of the host mount that have to be kept by a read-only remount.
    unsigned long remount_flags;  // NOLINT
  };

  static int InitMain(void* sandbox);
  static int ProgramMain(void* sandbox);

  // Body of the init process: sets up the namespaces, starts the program and
  // reports its wait status on status_fds_.
  [[noreturn]] void Init();
  void MountRoot();

  void AddMountPoint(MountPoint::Kind kind, const std::string& source,
                     const std::string& path, bool read_only,
                     unsigned long remount_flags);  // NOLINT
  void AddParents(const std::string& path);
  bool AddReadOnlyPath(const std::string& path, std::string* error_msg);

  // Empty folder of the host where the new root is mounted.
  std::string new_root_;
  std::string uid_map_;
  std::string gid_map_;
  std::vector<MountPoint> mount_points_;
  std::set<std::string> planned_paths_;
  std::vector<char> init_stack_;
  std::vector<char> program_stack_;
  int status_fds_[2] = {-1, -1};
};

}  // namespace sandbox
#endif
