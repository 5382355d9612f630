#include <signal.h>
#include <unistd.h>

#include <cstdlib>

int main(int argc, char** argv) {
  if (argc < 2) return 1;
  kill(getpid(), atoi(argv[1]));
  return 0;
}
