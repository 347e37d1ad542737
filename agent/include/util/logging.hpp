#pragma once

#include <string>

#include "fastlog/fastlog.hpp"

namespace hostpulse {

inline constexpr char kAgentLoggerName[] = "agent_file_logger";

// 创建文件日志器，level 取值 debug/info/warn/error，非法值按 info 处理
fastlog::file::FileLogger& init_logging(const std::string& log_dir,
                                        const std::string& level);

// 将字符串级别转换为 fastlog 级别
fastlog::LogLevel parse_log_level(const std::string& level);

// 获取日志器；尚未初始化时以默认目录创建
fastlog::file::FileLogger& agent_log();

}  // namespace hostpulse
