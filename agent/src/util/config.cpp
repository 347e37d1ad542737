#include "util/config.hpp"

#include <cstdlib>
#include <sstream>

namespace hostpulse {

namespace {
bool lookup_env(const char* name, std::string* value) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }
  *value = raw;
  return true;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}
}  // namespace

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

AgentConfig load_config(int argc, char* argv[]) {
  AgentConfig config;
  std::string value;

  // 监听地址：argv[1] > LISTEN > PORT
  if (lookup_env("PORT", &value) && !value.empty()) {
    config.listen_address = value.find(':') == std::string::npos
                                ? "0.0.0.0:" + value
                                : value;
  }
  if (lookup_env("LISTEN", &value) && !value.empty()) {
    config.listen_address = value;
  }
  if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
    config.listen_address = argv[1];
  }

  if (lookup_env("LOG_LEVEL", &value)) {
    config.log_level = trim(value);
  }
  if (lookup_env("LOG_DIR", &value) && !value.empty()) {
    config.log_dir = value;
  }
  if (lookup_env("SYS_SENSORS", &value) && !value.empty()) {
    config.sys_root = value;
  }
  if (lookup_env("FILESYSTEM", &value)) {
    config.filesystem = trim(value);
  }
  if (lookup_env("EXTRA_FILESYSTEMS", &value)) {
    config.extra_filesystems = split_list(value);
  }
  if (lookup_env("NICS", &value)) {
    config.nics_set = true;
    config.nics = split_list(value);
  }
  if (lookup_env("DOCKER_HOST", &value) && !value.empty()) {
    config.docker_host = value;
  }
  return config;
}

}  // namespace hostpulse
