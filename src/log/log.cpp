#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace ferry {

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& level, const std::string& log_path) {
  try {
    spdlog::sink_ptr sink;

    if (log_path.empty()) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      // 确保日志目录存在
      std::filesystem::path path(log_path);
      std::error_code ec;
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
      }
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
    }

    auto logger = std::make_shared<spdlog::logger>("ferry", sink);
    logger->set_level(parse_level(level));

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    // 重复初始化时替换旧的 logger
    spdlog::drop("ferry");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::debug("logging initialized (level: {})", level);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

bool wire_logging_enabled() {
  return spdlog::default_logger()->should_log(spdlog::level::trace);
}

}  // namespace ferry
