#ifndef REMOTE_SERVICE_HPP
#define REMOTE_SERVICE_HPP

#include "executor/executor.hpp"
#include "grpc++/server_context.h"
#include "proto/codebox.grpc.pb.h"

namespace remote {

// Exposes an executor as the CodeExecutor gRPC service. Exceptions thrown by
// the executor become error statuses: INVALID_ARGUMENT for an unsupported
// language, RESOURCE_EXHAUSTED when there is no capacity left, INTERNAL for
// anything else.
class CodeExecutorServiceImpl : public proto::CodeExecutor::Service {
 public:
  explicit CodeExecutorServiceImpl(executor::Executor* executor)
      : executor_(executor) {}

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::ExecutionRequest* request,
                       proto::ExecutionResult* result) override;

  grpc::Status Health(grpc::ServerContext* context,
                      const proto::HealthRequest* request,
                      proto::HealthResponse* response) override;

 private:
  executor::Executor* executor_;
};

}  // namespace remote

#endif
