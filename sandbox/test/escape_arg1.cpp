#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <thread>

// Leaves behind a child in a new session, which sleeps for argv[1] seconds,
// and exits immediately.
int main(int argc, char** argv) {
  if (argc < 2) return 1;
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    setsid();
    for (int fd = 0; fd < 3; fd++) close(fd);
    std::this_thread::sleep_for(
        std::chrono::microseconds(static_cast<int64_t>(atof(argv[1]) * 1e6)));
  }
  return 0;
}
