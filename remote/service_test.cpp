#include "remote/service.hpp"

#include <memory>

#include "executor/admission.hpp"
#include "executor/remote_executor.hpp"
#include "executor/runner.hpp"
#include "gmock/gmock.h"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

// Answers according to the code of the request.
class FakeExecutor : public executor::Executor {
 public:
  std::string Id() const override { return "FAKE"; }

  proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) override {
    if (request.language() != "python") {
      throw executor::unsupported_language("Language '" + request.language() +
                                           "' is not supported.");
    }
    if (request.code() == "busy") {
      throw executor::too_many_executions("Execution failed: busy");
    }
    if (request.code() == "broken") {
      throw executor::execution_failed("fork: Resource temporarily unavailable");
    }
    proto::ExecutionResult result;
    result.set_outcome(proto::COMPLETED);
    result.set_stdout_data(request.code());
    if (request.has_input_data()) result.set_stderr_data(request.input_data());
    result.set_exit_code(0);
    return result;
  }

  proto::HealthResponse Health() override {
    proto::HealthResponse response;
    response.set_status("healthy");
    response.set_language("python");
    response.set_max_concurrent_executions(4);
    return response;
  }
};

class ServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    service_ = std::make_unique<remote::CodeExecutorServiceImpl>(&executor_);
    int port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_TRUE(server_);
    ASSERT_NE(port, 0);
    address_ = "127.0.0.1:" + std::to_string(port);
    stub_ = proto::CodeExecutor::NewStub(
        grpc::CreateChannel(address_, grpc::InsecureChannelCredentials()));
  }

  void TearDown() override { server_->Shutdown(); }

  grpc::Status Execute(const std::string& code, proto::ExecutionResult* result,
                       const std::string& language = "python") {
    proto::ExecutionRequest request;
    request.set_code(code);
    request.set_language(language);
    grpc::ClientContext context;
    return stub_->Execute(&context, request, result);
  }

  FakeExecutor executor_;
  std::unique_ptr<remote::CodeExecutorServiceImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<proto::CodeExecutor::Stub> stub_;
  std::string address_;
};

// NOLINTNEXTLINE
TEST_F(ServiceTest, ExecuteOk) {
  proto::ExecutionResult result;
  grpc::Status status = Execute("print(1)", &result);
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(result.outcome(), proto::COMPLETED);
  EXPECT_EQ(result.stdout_data(), "print(1)");
  EXPECT_TRUE(result.has_exit_code());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, UnsupportedLanguage) {
  proto::ExecutionResult result;
  grpc::Status status = Execute("1", &result, "ruby");
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(status.error_message(), HasSubstr("'ruby'"));
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, CapacityExceeded) {
  proto::ExecutionResult result;
  grpc::Status status = Execute("busy", &result);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, InternalFailure) {
  proto::ExecutionResult result;
  grpc::Status status = Execute("broken", &result);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
  EXPECT_THAT(status.error_message(), HasSubstr("fork"));
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, Health) {
  grpc::ClientContext context;
  proto::HealthResponse response;
  grpc::Status status =
      stub_->Health(&context, proto::HealthRequest(), &response);
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.status(), "healthy");
  EXPECT_EQ(response.max_concurrent_executions(), 4);
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, RemoteExecutor) {
  executor::RemoteExecutor remote(address_);
  proto::ExecutionRequest request;
  request.set_code("x");
  request.set_language("python");
  request.set_input_data("in");
  proto::ExecutionResult result = remote.Execute(request);
  EXPECT_EQ(result.stdout_data(), "x");
  EXPECT_EQ(result.stderr_data(), "in");
  EXPECT_EQ(remote.Health().language(), "python");
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, RemoteExecutorErrors) {
  executor::RemoteExecutor remote(address_);
  proto::ExecutionRequest request;
  request.set_language("python");
  request.set_code("busy");
  EXPECT_THROW(remote.Execute(request),  // NOLINT
               executor::too_many_executions);
  request.set_code("broken");
  EXPECT_THROW(remote.Execute(request),  // NOLINT
               executor::execution_failed);
  request.set_language("ruby");
  EXPECT_THROW(remote.Execute(request),  // NOLINT
               executor::unsupported_language);
}

}  // namespace
