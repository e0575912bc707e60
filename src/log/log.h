#ifndef FERRY_LOG_H
#define FERRY_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace ferry {

/**
 * 初始化日志系统
 *
 * 创建名为 "ferry" 的 logger 并设为默认 logger。
 * - log_path 为空时输出到 stderr，否则追加写入该文件
 * - level: trace / debug / info / warn / err / critical / off
 *
 * 级别为 trace 时，curl 的调试输出（包括线上数据）也会被转发到日志。
 */
void init_log(const std::string& level = "info", const std::string& log_path = "");

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * 是否需要打开 curl 的 verbose 输出
 */
bool wire_logging_enabled();

}  // namespace ferry

#endif  // FERRY_LOG_H
