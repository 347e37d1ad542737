#include "rpc/agent_service_impl.hpp"

#include <grpcpp/grpcpp.h>

#include "util/logging.hpp"

namespace hostpulse {

AgentServiceImpl::AgentServiceImpl(Agent& agent) : _agent(agent) {}

::grpc::Status AgentServiceImpl::GetStats(::grpc::ServerContext* context,
                                          const ::google::protobuf::Empty* request,
                                          ::hostpulse::proto::CombinedData* response) {
  agent_log().debug("GetStats from {}", context ? context->peer() : "local");
  // 实时采集
  _agent.gather_stats(response);
  return grpc::Status::OK;
}

}  // namespace hostpulse
