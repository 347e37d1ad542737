#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>

namespace hostpulse {

namespace {
constexpr char kDefaultLogDir[] = "/tmp/hostpulse_logs/agent";

std::mutex& logger_mutex() {
  static std::mutex mtx;
  return mtx;
}

fastlog::file::FileLogger& make_agent_logger(const std::string& log_dir) {
  std::filesystem::path dir = log_dir.empty() ? kDefaultLogDir : log_dir;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return fastlog::file::make_logger(kAgentLoggerName, dir / "agent.log");
}
}  // namespace

fastlog::LogLevel parse_log_level(const std::string& level) {
  std::string lower = level;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") return fastlog::LogLevel::Debug;
  if (lower == "warn") return fastlog::LogLevel::Warn;
  if (lower == "error") return fastlog::LogLevel::Error;
  return fastlog::LogLevel::Info;
}

fastlog::file::FileLogger& init_logging(const std::string& log_dir,
                                        const std::string& level) {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto* log = fastlog::file::get_logger(kAgentLoggerName);
  if (log == nullptr) {
    log = &make_agent_logger(log_dir);
  }
  log->set_level(parse_log_level(level));
  return *log;
}

fastlog::file::FileLogger& agent_log() {
  // 日志器创建后只读，多线程直接查找即可
  if (auto* log = fastlog::file::get_logger(kAgentLoggerName)) {
    return *log;
  }
  std::lock_guard<std::mutex> lock(logger_mutex());
  if (auto* log = fastlog::file::get_logger(kAgentLoggerName)) {
    return *log;
  }
  auto& log = make_agent_logger(kDefaultLogDir);
  log.set_level(fastlog::LogLevel::Info);
  return log;
}

}  // namespace hostpulse
