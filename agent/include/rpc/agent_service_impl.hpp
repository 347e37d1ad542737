#pragma once

#include <grpcpp/support/status.h>

#include "hostpulse.grpc.pb.h"
#include "hostpulse.pb.h"
#include "hostpulse/agent.hpp"

namespace hostpulse {
// agent 对外的拉取接口，每次请求采集一份完整快照
class AgentServiceImpl : public hostpulse::proto::AgentService::Service {
 public:
  explicit AgentServiceImpl(Agent& agent);
  ~AgentServiceImpl() override = default;

  ::grpc::Status GetStats(::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
                          ::hostpulse::proto::CombinedData* response) override;

 private:
  Agent& _agent;
};
}  // namespace hostpulse
