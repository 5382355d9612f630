#ifndef EXECUTOR_REMOTE_EXECUTOR_HPP
#define EXECUTOR_REMOTE_EXECUTOR_HPP

#include <memory>

#include "executor/executor.hpp"
#include "grpc++/channel.h"
#include "proto/codebox.grpc.pb.h"

namespace executor {

// Forwards requests to a codebox server. Errors reported by the server are
// thrown as the exceptions a LocalExecutor would throw.
class RemoteExecutor : public Executor {
 public:
  explicit RemoteExecutor(std::string remote_address)
      : remote_address_(std::move(remote_address)) {}

  std::string Id() const override { return "REMOTE " + remote_address_; }
  proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) override;
  proto::HealthResponse Health() override;

  ~RemoteExecutor() override = default;

 private:
  void MaybeGetNewChannelAndStub();

  std::string remote_address_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<proto::CodeExecutor::Stub> stub_;
};

}  // namespace executor

#endif
