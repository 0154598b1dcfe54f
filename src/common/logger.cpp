#include "asciibar/common/logger.hpp"
#include "asciibar/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace asciibar {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    const std::string logger_name = constants::system::LOGGER_NAME;

    try {
        auto spdlog_level = toSpdlogLevel(level);
        std::vector<spdlog::sink_ptr> sinks;
        
        if (mode == LogMode::FILE_ONLY && !log_file.empty()) {
            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
            
            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }
            
            try {
                size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, max_size, logging_config.max_files);
                file_sink->set_level(spdlog_level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "[Logger] Failed to open log file: " << log_file 
                         << " - " << ex.what() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
            }
        }
        
        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog_level);
            sinks.push_back(console_sink);
        }
        
        logger_ = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
        current_format_ = logging_config.format;
        
        if (current_format_ == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }
        
        logger_->set_level(spdlog_level);
        
        if (mode == LogMode::FILE_ONLY) {
            logger_->flush_on(spdlog::level::info);
        }
        
        spdlog::drop(logger_name);
        spdlog::register_logger(logger_);
        initialized_ = true;
        
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger_ = std::make_shared<spdlog::logger>(logger_name, console_sink);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(toSpdlogLevel(level));
        initialized_ = true;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

}}
