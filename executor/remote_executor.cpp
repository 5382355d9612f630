#include "executor/remote_executor.hpp"

#include "executor/admission.hpp"
#include "executor/runner.hpp"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "grpc/grpc.h"

namespace executor {

namespace {
[[noreturn]] void ThrowStatus(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::INVALID_ARGUMENT:
      throw unsupported_language(status.error_message());
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      throw too_many_executions(status.error_message().c_str());
    case grpc::StatusCode::INTERNAL:
      throw execution_failed(status.error_message());
    default:
      throw std::runtime_error(status.error_message());
  }
}
}  // namespace

proto::ExecutionResult RemoteExecutor::Execute(
    const proto::ExecutionRequest& request) {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  proto::ExecutionResult result;
  grpc::Status status = stub_->Execute(&context, request, &result);
  if (!status.ok()) ThrowStatus(status);
  return result;
}

proto::HealthResponse RemoteExecutor::Health() {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  proto::HealthResponse response;
  grpc::Status status =
      stub_->Health(&context, proto::HealthRequest(), &response);
  if (!status.ok()) ThrowStatus(status);
  return response;
}

void RemoteExecutor::MaybeGetNewChannelAndStub() {
  if (channel_ &&
      channel_->GetState(/* try_to_connect = */ true) != GRPC_CHANNEL_SHUTDOWN)
    return;
  channel_ =
      grpc::CreateChannel(remote_address_, grpc::InsecureChannelCredentials());
  stub_ = proto::CodeExecutor::NewStub(channel_);
}

}  // namespace executor
