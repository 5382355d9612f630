#include <fstream>

// Writes a line to the file argv[1], exits with 1 if that fails.
int main(int argc, char** argv) {
  if (argc < 2) return 2;
  std::ofstream out(argv[1]);
  if (!out) return 1;
  out << "written" << std::endl;
  return out ? 0 : 1;
}
