#include "container/socket_docker_client.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unordered_map>

#include "hostpulse/version.hpp"
#include "util/logging.hpp"

namespace hostpulse {

namespace {
constexpr size_t kReadChunk = 16 * 1024;
constexpr size_t kMaxHeaderBytes = 64 * 1024;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void set_timeout(ClientError* error, const std::string& what) {
  error->timeout = true;
  error->message = what + ": timeout";
}

void set_errno(ClientError* error, const std::string& what) {
  error->timeout = false;
  error->message = what + ": " + std::strerror(errno);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

// 等待 fd 可读/可写，超时返回 0
int wait_fd(int fd, short events, std::chrono::steady_clock::time_point deadline) {
  while (true) {
    int ms = remaining_ms(deadline);
    if (ms <= 0) return 0;
    struct pollfd pfd {fd, events, 0};
    int ret = ::poll(&pfd, 1, ms);
    if (ret < 0 && errno == EINTR) continue;
    return ret;
  }
}

bool connect_fd(int fd, const struct sockaddr* addr, socklen_t len,
                std::chrono::steady_clock::time_point deadline, ClientError* error) {
  if (::connect(fd, addr, len) == 0) {
    return true;
  }
  if (errno != EINPROGRESS && errno != EAGAIN) {
    set_errno(error, "connect");
    return false;
  }
  int ret = wait_fd(fd, POLLOUT, deadline);
  if (ret == 0) {
    set_timeout(error, "connect");
    return false;
  }
  if (ret < 0) {
    set_errno(error, "connect");
    return false;
  }
  int so_error = 0;
  socklen_t so_len = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
    errno = so_error;
    set_errno(error, "connect");
    return false;
  }
  return true;
}
}  // namespace

SocketDockerClient::SocketDockerClient(const std::string& docker_host, int timeout_ms,
                                       size_t max_idle_connections)
    : _timeout_ms(timeout_ms), _max_idle(max_idle_connections) {
  const std::string unix_scheme = "unix://";
  const std::string tcp_scheme = "tcp://";
  const std::string http_scheme = "http://";
  std::string rest;
  if (docker_host.rfind(unix_scheme, 0) == 0) {
    _unix = true;
    _unix_path = docker_host.substr(unix_scheme.size());
  } else if (docker_host.rfind("/", 0) == 0) {
    _unix = true;
    _unix_path = docker_host;
  } else if (docker_host.rfind(tcp_scheme, 0) == 0) {
    _unix = false;
    rest = docker_host.substr(tcp_scheme.size());
  } else if (docker_host.rfind(http_scheme, 0) == 0) {
    _unix = false;
    rest = docker_host.substr(http_scheme.size());
  }

  if (_unix) {
    _valid = !_unix_path.empty() && _unix_path.size() < sizeof(sockaddr_un::sun_path);
  } else {
    auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
      _tcp_host = rest.substr(0, colon);
      _tcp_port = rest.substr(colon + 1);
    } else {
      _tcp_host = rest;
      _tcp_port = "2375";
    }
    _valid = !_tcp_host.empty() && !_tcp_port.empty();
  }
  if (!_valid) {
    agent_log().error("Invalid DOCKER_HOST: {}", docker_host);
  }
}

SocketDockerClient::~SocketDockerClient() {
  close_idle_connections();
}

size_t SocketDockerClient::idle_connections() const {
  std::lock_guard<std::mutex> lock(_idle_mtx);
  return _idle.size();
}

void SocketDockerClient::close_idle_connections() {
  std::vector<int> idle;
  {
    std::lock_guard<std::mutex> lock(_idle_mtx);
    idle.swap(_idle);
  }
  for (int fd : idle) {
    ::close(fd);
  }
}

int SocketDockerClient::take_idle() {
  std::lock_guard<std::mutex> lock(_idle_mtx);
  if (_idle.empty()) {
    return -1;
  }
  int fd = _idle.back();
  _idle.pop_back();
  return fd;
}

void SocketDockerClient::put_idle(int fd) {
  {
    std::lock_guard<std::mutex> lock(_idle_mtx);
    if (_idle.size() < _max_idle) {
      _idle.push_back(fd);
      return;
    }
  }
  ::close(fd);
}

int SocketDockerClient::open_connection(Deadline deadline, ClientError* error) {
  if (_unix) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      set_errno(error, "socket");
      return -1;
    }
    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, _unix_path.c_str(), _unix_path.size() + 1);
    if (!connect_fd(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), deadline,
                    error)) {
      ::close(fd);
      return -1;
    }
    return fd;
  }

  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* result = nullptr;
  int rc = ::getaddrinfo(_tcp_host.c_str(), _tcp_port.c_str(), &hints, &result);
  if (rc != 0) {
    error->timeout = false;
    error->message = std::string("resolve ") + _tcp_host + ": " + gai_strerror(rc);
    return -1;
  }
  int fd = -1;
  for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                  ai->ai_protocol);
    if (fd < 0) {
      set_errno(error, "socket");
      continue;
    }
    if (connect_fd(fd, ai->ai_addr, ai->ai_addrlen, deadline, error)) {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(result);
  return fd;
}

bool SocketDockerClient::send_all(int fd, const std::string& data, Deadline deadline,
                                  ClientError* error) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int ret = wait_fd(fd, POLLOUT, deadline);
      if (ret == 0) {
        set_timeout(error, "write");
        return false;
      }
      if (ret < 0) {
        set_errno(error, "write");
        return false;
      }
      continue;
    }
    set_errno(error, "write");
    return false;
  }
  return true;
}

int SocketDockerClient::read_more(int fd, std::string* buffer, Deadline deadline,
                                  ClientError* error) {
  char chunk[kReadChunk];
  while (true) {
    ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n > 0) {
      buffer->append(chunk, static_cast<size_t>(n));
      return static_cast<int>(n);
    }
    if (n == 0) {
      return 0;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      set_errno(error, "read");
      return -1;
    }
    int ret = wait_fd(fd, POLLIN, deadline);
    if (ret == 0) {
      set_timeout(error, "read");
      return -1;
    }
    if (ret < 0) {
      set_errno(error, "read");
      return -1;
    }
  }
}

bool SocketDockerClient::read_response(int fd, Deadline deadline, Response* response,
                                       ClientError* error) {
  std::string buf;
  size_t header_end = std::string::npos;
  while ((header_end = buf.find("\r\n\r\n")) == std::string::npos) {
    if (buf.size() > kMaxHeaderBytes) {
      error->message = "response headers too large";
      return false;
    }
    int n = read_more(fd, &buf, deadline, error);
    if (n < 0) return false;
    if (n == 0) {
      error->timeout = false;
      error->message = buf.empty() ? "connection closed by peer" : "unexpected EOF in headers";
      return false;
    }
    response->received = true;
  }

  // 状态行: HTTP/1.1 200 OK
  std::string head = buf.substr(0, header_end);
  size_t line_end = head.find("\r\n");
  std::string status_line = head.substr(0, line_end);
  if (status_line.rfind("HTTP/1.", 0) != 0 || status_line.size() < 12) {
    error->message = "malformed status line: " + status_line;
    return false;
  }
  bool http11 = status_line[7] == '1';
  response->status = std::atoi(status_line.c_str() + 9);

  std::unordered_map<std::string, std::string> headers;
  size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
  while (pos < head.size()) {
    size_t next = head.find("\r\n", pos);
    if (next == std::string::npos) next = head.size();
    std::string line = head.substr(pos, next - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    pos = next + 2;
  }

  std::string connection = to_lower(headers["connection"]);
  response->keep_alive = http11 ? connection != "close" : connection == "keep-alive";

  std::string rest = buf.substr(header_end + 4);
  std::string& body = response->body;
  body.clear();

  if (to_lower(headers["transfer-encoding"]).find("chunked") != std::string::npos) {
    size_t at = 0;
    while (true) {
      size_t size_end;
      while ((size_end = rest.find("\r\n", at)) == std::string::npos) {
        int n = read_more(fd, &rest, deadline, error);
        if (n <= 0) {
          if (n == 0) error->message = "unexpected EOF in chunked body";
          return false;
        }
      }
      std::string size_line = rest.substr(at, size_end - at);
      auto ext = size_line.find(';');
      if (ext != std::string::npos) size_line = size_line.substr(0, ext);
      char* parse_end = nullptr;
      size_t chunk_size = std::strtoul(size_line.c_str(), &parse_end, 16);
      if (parse_end == size_line.c_str()) {
        error->message = "malformed chunk size: " + size_line;
        return false;
      }
      at = size_end + 2;
      if (chunk_size == 0) {
        // 跳过 trailer 直到空行
        while (true) {
          size_t trailer_end;
          while ((trailer_end = rest.find("\r\n", at)) == std::string::npos) {
            int n = read_more(fd, &rest, deadline, error);
            if (n <= 0) {
              if (n == 0) error->message = "unexpected EOF in chunked trailer";
              return false;
            }
          }
          bool last = trailer_end == at;
          at = trailer_end + 2;
          if (last) break;
        }
        break;
      }
      while (rest.size() < at + chunk_size + 2) {
        int n = read_more(fd, &rest, deadline, error);
        if (n <= 0) {
          if (n == 0) error->message = "unexpected EOF in chunk";
          return false;
        }
      }
      body.append(rest, at, chunk_size);
      at += chunk_size + 2;
    }
  } else if (headers.count("content-length") > 0) {
    size_t length = std::strtoul(headers["content-length"].c_str(), nullptr, 10);
    while (rest.size() < length) {
      int n = read_more(fd, &rest, deadline, error);
      if (n <= 0) {
        if (n == 0) error->message = "unexpected EOF in body";
        return false;
      }
    }
    body = rest.substr(0, length);
  } else {
    // 没有长度信息，读到连接关闭为止
    while (true) {
      int n = read_more(fd, &rest, deadline, error);
      if (n < 0) return false;
      if (n == 0) break;
    }
    body = std::move(rest);
    response->keep_alive = false;
  }
  return true;
}

bool SocketDockerClient::get(const std::string& path, std::string* body, ClientError* error) {
  if (!_valid) {
    error->timeout = false;
    error->message = "invalid docker host";
    return false;
  }
  Deadline deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_timeout_ms);

  std::string request = "GET " + path + " HTTP/1.1\r\n" +
                        "Host: localhost\r\n" +
                        "User-Agent: hostpulse/" + kAgentVersion + "\r\n" +
                        "Accept: application/json\r\n\r\n";

  int fd = take_idle();
  bool reused = fd >= 0;
  Response response;
  while (true) {
    if (fd < 0) {
      fd = open_connection(deadline, error);
      if (fd < 0) {
        return false;
      }
    }
    response = Response{};
    if (send_all(fd, request, deadline, error) &&
        read_response(fd, deadline, &response, error)) {
      break;
    }
    ::close(fd);
    fd = -1;
    // 空闲连接可能已被对端关闭：尚未收到任何响应字节时换新连接重发一次
    if (reused && !error->timeout && !response.received) {
      agent_log().debug("Stale idle connection for GET {}: {}, reconnecting", path,
                        error->message);
      reused = false;
      *error = ClientError{};
      continue;
    }
    return false;
  }
  if (response.keep_alive) {
    put_idle(fd);
  } else {
    ::close(fd);
  }

  if (response.status < 200 || response.status >= 300) {
    error->timeout = false;
    error->message = "GET " + path + ": status " + std::to_string(response.status) + " " +
                     trim(response.body);
    return false;
  }
  *body = std::move(response.body);
  return true;
}

}  // namespace hostpulse
