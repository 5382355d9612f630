#include "remote/service.hpp"

#include "executor/admission.hpp"
#include "executor/runner.hpp"
#include "glog/logging.h"

namespace remote {

grpc::Status CodeExecutorServiceImpl::Execute(
    grpc::ServerContext* /*context*/, const proto::ExecutionRequest* request,
    proto::ExecutionResult* result) {
  try {
    *result = executor_->Execute(*request);
    return grpc::Status::OK;
  } catch (executor::unsupported_language& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (executor::too_many_executions& e) {
    return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, e.what());
  } catch (executor::execution_failed& e) {
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  } catch (std::exception& e) {
    LOG(ERROR) << "Execute: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status CodeExecutorServiceImpl::Health(
    grpc::ServerContext* /*context*/, const proto::HealthRequest* /*request*/,
    proto::HealthResponse* response) {
  try {
    *response = executor_->Health();
    return grpc::Status::OK;
  } catch (std::exception& e) {
    LOG(ERROR) << "Health: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

}  // namespace remote
