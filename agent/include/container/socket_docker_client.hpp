#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "container/docker_client.hpp"

namespace hostpulse {

/**
 * 基于 Unix 域套接字（或 TCP）的 HTTP/1.1 客户端
 *
 * 支持 keep-alive 连接复用、Content-Length 与 chunked 响应体，
 * 每个请求受 timeout_ms 的整体超时约束。
 */
class SocketDockerClient : public DockerClient {
 public:
  // docker_host 形如 unix:///var/run/docker.sock 或 tcp://127.0.0.1:2375
  SocketDockerClient(const std::string& docker_host, int timeout_ms,
                     size_t max_idle_connections = 20);
  ~SocketDockerClient() override;

  SocketDockerClient(const SocketDockerClient&) = delete;
  SocketDockerClient& operator=(const SocketDockerClient&) = delete;

  bool get(const std::string& path, std::string* body, ClientError* error) override;
  void close_idle_connections() override;

  bool valid() const { return _valid; }
  size_t idle_connections() const;

 private:
  using Deadline = std::chrono::steady_clock::time_point;

  struct Response {
    int status = 0;
    std::string body;
    bool keep_alive = false;
    bool received = false;  // 已收到响应字节
  };

  int open_connection(Deadline deadline, ClientError* error);
  int take_idle();
  void put_idle(int fd);

  bool send_all(int fd, const std::string& data, Deadline deadline, ClientError* error);
  // 返回读到的字节数，0 表示对端关闭，-1 表示出错或超时
  int read_more(int fd, std::string* buffer, Deadline deadline, ClientError* error);
  bool read_response(int fd, Deadline deadline, Response* response, ClientError* error);

  bool _valid = false;
  bool _unix = true;
  std::string _unix_path;
  std::string _tcp_host;
  std::string _tcp_port;
  int _timeout_ms;
  size_t _max_idle;

  mutable std::mutex _idle_mtx;
  std::vector<int> _idle;
};

}  // namespace hostpulse
