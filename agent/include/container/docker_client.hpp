#pragma once

#include <string>

namespace hostpulse {

struct ClientError {
  bool timeout = false;  // 请求超时
  std::string message;
};

/// 容器运行时 HTTP 客户端接口（仅 GET）
class DockerClient {
 public:
  virtual ~DockerClient() = default;

  // 返回 true 表示收到 2xx 响应，body 为响应体
  virtual bool get(const std::string& path, std::string* body, ClientError* error) = 0;

  // 关闭所有空闲的长连接（丢弃可能已损坏的 keep-alive 连接）
  virtual void close_idle_connections() = 0;
};

}  // namespace hostpulse
