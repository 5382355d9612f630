#include <iostream>
#include <iterator>
#include <string>

#include "executor/remote_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "util/file.hpp"

DEFINE_string(server, "127.0.0.1:7070", "server to connect to");  // NOLINT
DEFINE_string(language, "python", "language of the program");     // NOLINT
DEFINE_string(input, "", "file to use as the standard input");     // NOLINT
DEFINE_bool(health, false, "only print the status of the server");  // NOLINT

namespace {

int PrintHealth(executor::Executor* executor) {
  proto::HealthResponse health = executor->Health();
  std::cout << health.DebugString();
  return health.status() == "healthy" ? 0 : 1;
}

int Run(executor::Executor* executor, const std::string& source) {
  proto::ExecutionRequest request;
  if (source.empty() || source == "-") {
    request.set_code(std::string(std::istreambuf_iterator<char>(std::cin),
                                 std::istreambuf_iterator<char>()));
  } else {
    request.set_code(util::File::Read(source));
  }
  request.set_language(FLAGS_language);
  if (!FLAGS_input.empty()) {
    request.set_input_data(util::File::Read(FLAGS_input));
  }

  proto::ExecutionResult result = executor->Execute(request);
  std::cout << result.stdout_data();
  std::cerr << result.stderr_data();
  std::cerr << "[" << proto::Outcome_Name(result.outcome()) << "] "
            << result.reason() << " (" << result.duration_ms() << "ms wall, "
            << result.cpu_time_ms() << "ms cpu, " << result.memory_usage_kb()
            << "KiB";
  if (result.truncated()) std::cerr << ", output truncated";
  std::cerr << ")" << std::endl;

  switch (result.outcome()) {
    case proto::COMPLETED:
      if (result.has_exit_code()) return result.exit_code();
      return 128 + result.signal();
    case proto::REJECTED_BY_POLICY:
      return 2;
    default:
      return 1;
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("codebox_client [flags] [source file | -]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  executor::RemoteExecutor executor(FLAGS_server);
  try {
    if (FLAGS_health) return PrintHealth(&executor);
    return Run(&executor, argc > 1 ? argv[1] : "");
  } catch (std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
