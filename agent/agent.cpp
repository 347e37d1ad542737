#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "container/socket_docker_client.hpp"
#include "hostpulse/agent.hpp"
#include "hostpulse/linux_host_provider.hpp"
#include "hostpulse/version.hpp"
#include "rpc/agent_service_impl.hpp"
#include "util/config.hpp"
#include "util/logging.hpp"

int main(int argc, char* argv[]) {
  hostpulse::AgentConfig config = hostpulse::load_config(argc, argv);
  auto& log = hostpulse::init_logging(config.log_dir, config.log_level);

  log.info("Starting hostpulse agent {}", hostpulse::kAgentVersion);
  log.info("Listen address: {}", config.listen_address);
  log.info("Docker host: {}", config.docker_host);

  hostpulse::LinuxHostProvider provider(config.proc_root, config.sys_root);
  hostpulse::SocketDockerClient docker(config.docker_host, config.docker_timeout_ms);

  hostpulse::Agent agent(config, provider, docker);
  agent.initialize();

  hostpulse::AgentServiceImpl service(agent);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    log.error("Failed to listen on {}", config.listen_address);
    return 1;
  }

  log.info("Agent listening on {}", config.listen_address);
  server->Wait();
  return 0;
}
