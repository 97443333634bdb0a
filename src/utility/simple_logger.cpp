/**
 * @file simple_logger.cpp
 * @brief coordmap 简单日志系统实现
 */

#include "coordmap/utility/simple_logger.hpp"
#include "coordmap/utility/config_manager.hpp"
#include <spdlog/async.h>
#include <spdlog/details/registry.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>

namespace coordmap {
namespace utility {

namespace {
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
}

LogLevel logLevelFromString(const std::string& level_str) {
    if (level_str == "trace") return LogLevel::TRACE;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "warn") return LogLevel::WARN;
    if (level_str == "error") return LogLevel::ERR;
    if (level_str == "critical") return LogLevel::CRITICAL;
    if (level_str == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

// ============================================================================
// SimpleLogger 实现
// ============================================================================

SimpleLogger& SimpleLogger::getInstance() {
    // 先构造spdlog注册表，使其在本单例之后析构
    spdlog::details::registry::instance();
    static SimpleLogger instance;

    // 自动初始化：如果还未初始化，则从配置文件自动初始化
    std::lock_guard<std::recursive_mutex> lock(instance.mutex_);
    if (!instance.initialized_) {
        instance.initializeFromConfig();
    }

    return instance;
}

SimpleLogger::~SimpleLogger() {
    // 程序退出时只释放自身持有的日志器，不再访问spdlog注册表
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    flush();
    component_loggers_.clear();
    main_logger_.reset();
    sinks_.clear();
    initialized_ = false;
}

void SimpleLogger::initialize(const std::string& logger_name,
                              LogLevel level,
                              const LogSinkConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    initializeLocked(logger_name, level, config);
}

void SimpleLogger::initializeLocked(const std::string& logger_name,
                                    LogLevel level,
                                    const LogSinkConfig& config) {
    if (initialized_) {
        if (main_logger_) {
            main_logger_->warn("Logger already initialized, skipping re-initialization");
        }
        return;
    }

    try {
        current_level_ = level;

        // 没有任何输出目标时日志器仍然创建，相当于关闭输出
        sinks_ = createSinks(config);

        if (config.async_enabled) {
            // 异步日志线程池：8192 队列大小，1个后台线程
            spdlog::init_thread_pool(8192, 1);

            main_logger_ = std::make_shared<spdlog::async_logger>(
                logger_name,
                sinks_.begin(),
                sinks_.end(),
                spdlog::thread_pool(),
                spdlog::async_overflow_policy::block
            );
        } else {
            main_logger_ = std::make_shared<spdlog::logger>(logger_name, sinks_.begin(), sinks_.end());
        }
        async_ = config.async_enabled;

        main_logger_->set_level(toSpdlogLevel(level));

        // 日志格式：[时间] [级别] [日志器名] 消息
        main_logger_->set_pattern(LOG_PATTERN);

        spdlog::register_logger(main_logger_);

        initialized_ = true;

        main_logger_->debug("coordmap logger initialized");
        main_logger_->debug("Log level: {}", static_cast<int>(level));
        if (config.file_enabled) {
            main_logger_->debug("Log file: {}", config.file_path);
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
    }
}

void SimpleLogger::initializeFromConfig() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    try {
        auto& config_manager = ConfigManager::getInstance();
        auto logger_config = config_manager.getComponentConfig(ConfigFileType::CORE, "logger");

        LogSinkConfig sink_config;
        sink_config.console_enabled = logger_config.value("console_enabled", true);
        sink_config.file_enabled = logger_config.value("file_enabled", false);
        sink_config.file_path = logger_config.value("file_path", std::string("logs/coordmap.log"));
        sink_config.max_file_size = logger_config.value("max_file_size", static_cast<size_t>(10485760));
        sink_config.max_files = logger_config.value("max_files", static_cast<size_t>(5));
        sink_config.async_enabled = logger_config.value("async_enabled", false);

        std::string logger_name = logger_config.value("name", std::string("coordmap"));
        LogLevel level = logLevelFromString(logger_config.value("level", std::string("warn")));

        initializeLocked(logger_name, level, sink_config);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger from config: " << e.what() << std::endl;
        // 使用默认配置作为备用
        initializeLocked("coordmap_default", LogLevel::WARN, LogSinkConfig{});
    }
}

std::shared_ptr<spdlog::logger> SimpleLogger::getMainLogger() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        initializeLocked("coordmap_default", LogLevel::WARN, LogSinkConfig{});
    }
    return main_logger_;
}

std::shared_ptr<spdlog::logger> SimpleLogger::getComponentLogger(const std::string& component_name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        initializeLocked("coordmap_default", LogLevel::WARN, LogSinkConfig{});
    }

    auto it = component_loggers_.find(component_name);
    if (it != component_loggers_.end()) {
        return it->second;
    }

    try {
        // 组件日志器与主日志器共享输出目标
        std::string logger_name = "coordmap." + component_name;

        std::shared_ptr<spdlog::logger> component_logger;

        if (async_ && spdlog::thread_pool()) {
            component_logger = std::make_shared<spdlog::async_logger>(
                logger_name,
                sinks_.begin(),
                sinks_.end(),
                spdlog::thread_pool(),
                spdlog::async_overflow_policy::block
            );
        } else {
            component_logger = std::make_shared<spdlog::logger>(logger_name, sinks_.begin(), sinks_.end());
        }

        component_logger->set_level(toSpdlogLevel(current_level_));
        component_logger->set_pattern(LOG_PATTERN);

        spdlog::register_logger(component_logger);

        component_loggers_[component_name] = component_logger;

        return component_logger;

    } catch (const std::exception& e) {
        if (main_logger_) {
            main_logger_->error("Failed to create component logger for '{}': {}", component_name, e.what());
        }
        // 返回主日志器作为备用
        return main_logger_;
    }
}

void SimpleLogger::setLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    current_level_ = level;
    auto spdlog_level = toSpdlogLevel(level);

    if (main_logger_) {
        main_logger_->set_level(spdlog_level);
    }

    for (auto& [name, logger] : component_loggers_) {
        if (logger) {
            logger->set_level(spdlog_level);
        }
    }
}

void SimpleLogger::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (main_logger_) {
        main_logger_->flush();
    }

    for (auto& [name, logger] : component_loggers_) {
        if (logger) {
            logger->flush();
        }
    }
}

void SimpleLogger::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }

    flush();

    component_loggers_.clear();
    main_logger_.reset();
    sinks_.clear();

    spdlog::shutdown();

    initialized_ = false;
}

spdlog::level::level_enum SimpleLogger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERR:      return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

std::vector<spdlog::sink_ptr> SimpleLogger::createSinks(const LogSinkConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            sinks.push_back(console_sink);
        }

        if (config.file_enabled) {
            // 确保日志目录存在
            std::filesystem::path log_path(config.file_path);
            std::filesystem::path log_dir = log_path.parent_path();

            if (!log_dir.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(log_dir, ec);
                if (ec) {
                    std::cerr << "Failed to create log directory: " << ec.message() << std::endl;
                }
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to create log sinks: " << e.what() << std::endl;
    }

    return sinks;
}

} // namespace utility
} // namespace coordmap
