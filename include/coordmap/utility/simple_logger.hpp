/**
 * @file simple_logger.hpp
 * @brief coordmap 简单日志系统
 *
 * @details 日志系统设计
 *
 * 1. 核心功能
 *    - 统一的日志接口：提供标准的日志记录方法
 *    - 多级别日志：支持 TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL
 *    - 多输出目标：支持控制台、文件等输出
 *    - 基于 spdlog 实现，可选异步输出
 *
 * 2. 设计模式
 *    - 单例模式：全局唯一的日志管理器
 *    - 首次使用时从配置管理器（core.logger）自动初始化
 *
 * 3. 使用方法
 *    @code
 *    // 显式初始化（可选）
 *    SimpleLogger::getInstance().initialize("coordmap", LogLevel::DEBUG);
 *
 *    // 记录日志
 *    LOG_INFO("Loaded {} transforms", count);
 *
 *    // 按模块记录日志
 *    LOG_COMPONENT_NAMED_DEBUG("reference.algebra", "compose: {} maps", n);
 *    @endcode
 */
#pragma once
// 告诉spdlog使用编译好的库版本，而不是头文件中的内联实现，从而避免符号重复定义
#ifndef SPDLOG_COMPILED_LIB
#define SPDLOG_COMPILED_LIB
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/async.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordmap {
namespace utility {

/**
 * @brief 日志级别枚举
 */
enum class LogLevel {
    TRACE = 0,    ///< 最详细的调试信息
    DEBUG = 1,    ///< 调试信息
    INFO = 2,     ///< 一般信息
    WARN = 3,     ///< 警告信息
    ERR = 4,      ///< 错误信息
    CRITICAL = 5, ///< 严重错误
    OFF = 6       ///< 关闭日志
};

/**
 * @brief 由字符串解析日志级别，未知字符串返回INFO
 */
LogLevel logLevelFromString(const std::string& level_str);

/**
 * @brief 日志输出目标配置
 */
struct LogSinkConfig {
    bool console_enabled = true;                  ///< 是否输出到控制台
    bool file_enabled = false;                    ///< 是否输出到文件
    std::string file_path = "logs/coordmap.log";  ///< 日志文件路径
    size_t max_file_size = 10 * 1024 * 1024;      ///< 最大文件大小 (10MB)
    size_t max_files = 5;                         ///< 最大文件数量
    bool async_enabled = false;                   ///< 是否启用异步日志
};

/**
 * @brief 简单日志管理器类
 *
 * 采用单例模式，管理整个库的日志系统。
 * 组件日志器的创建由互斥锁保护，可在多线程中并发获取。
 */
class SimpleLogger {
public:
    /**
     * @brief 获取日志管理器实例
     */
    static SimpleLogger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param logger_name 主日志器名称
     * @param level 日志级别
     * @param config 日志配置
     */
    void initialize(const std::string& logger_name,
                   LogLevel level = LogLevel::INFO,
                   const LogSinkConfig& config = LogSinkConfig{});

    /**
     * @brief 从配置管理器（core.logger）初始化日志系统
     */
    void initializeFromConfig();

    std::shared_ptr<spdlog::logger> getMainLogger();

    /**
     * @brief 获取或创建组件日志器，名称为 "coordmap.<component_name>"
     */
    std::shared_ptr<spdlog::logger> getComponentLogger(const std::string& component_name);

    void setLogLevel(LogLevel level);

    LogLevel getLogLevel() const { return current_level_; }

    void flush();

    /**
     * @brief 显式关闭日志系统（包括spdlog注册表），析构时不会调用
     */
    void shutdown();

private:
    SimpleLogger() = default;
    ~SimpleLogger();
    SimpleLogger(const SimpleLogger&) = delete;
    SimpleLogger& operator=(const SimpleLogger&) = delete;

    void initializeLocked(const std::string& logger_name,
                          LogLevel level,
                          const LogSinkConfig& config);

    spdlog::level::level_enum toSpdlogLevel(LogLevel level);

    std::vector<spdlog::sink_ptr> createSinks(const LogSinkConfig& config);

private:
    std::shared_ptr<spdlog::logger> main_logger_;           ///< 主日志器
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> component_loggers_; ///< 组件日志器映射
    std::vector<spdlog::sink_ptr> sinks_;                   ///< 日志输出目标
    LogLevel current_level_ = LogLevel::INFO;               ///< 当前日志级别
    bool initialized_ = false;                              ///< 是否已初始化
    bool async_ = false;                                    ///< 是否使用异步线程池
    std::recursive_mutex mutex_;                            ///< 保护上述成员
};

} // namespace utility
} // namespace coordmap

// ============================================================================
// 便捷宏定义
// ============================================================================

/**
 * @brief 主日志器宏定义
 */
#define LOG_TRACE(...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->debug(__VA_ARGS__)
#define LOG_INFO(...)     if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->info(__VA_ARGS__)
#define LOG_WARN(...)     if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->warn(__VA_ARGS__)
#define LOG_ERROR(...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->error(__VA_ARGS__)
#define LOG_CRITICAL(...) if(auto logger = coordmap::utility::SimpleLogger::getInstance().getMainLogger()) logger->critical(__VA_ARGS__)

/**
 * @brief 带组件名称的日志宏定义
 */
#define LOG_COMPONENT_NAMED_TRACE(name, ...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->trace(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_DEBUG(name, ...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->debug(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_INFO(name, ...)     if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->info(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_WARN(name, ...)     if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->warn(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_ERROR(name, ...)    if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->error(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_CRITICAL(name, ...) if(auto logger = coordmap::utility::SimpleLogger::getInstance().getComponentLogger(name)) logger->critical(__VA_ARGS__)
