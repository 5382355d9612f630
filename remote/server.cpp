#include <memory>
#include <string>

#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "remote/service.hpp"
#include "sandbox/namespaced.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");  // NOLINT
DEFINE_int32(port, 7070, "port to listen on");  // NOLINT

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs untrusted code snippets in a sandbox");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  if (FLAGS_isolate && !sandbox::Namespaced::Supported()) {
    LOG(FATAL) << "Cannot create the namespaces of the isolated sandbox; "
                  "enable unprivileged user namespaces or pass --noisolate";
  }

  std::unique_ptr<executor::LocalExecutor> executor;
  try {
    executor = executor::LocalExecutor::FromFlags();
  } catch (std::exception& e) {
    LOG(FATAL) << "Invalid configuration: " << e.what();
  }
  CHECK(executor);
  proto::HealthResponse health = executor->Health();
  LOG(INFO) << "Running " << health.language() << " with "
            << health.max_concurrent_executions() << " parallel executions, "
            << health.limits().ShortDebugString();

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  remote::CodeExecutorServiceImpl service(executor.get());
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Cannot listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}
