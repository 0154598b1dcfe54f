#include "asciibar/common/config.hpp"
#include "asciibar/common/constants.hpp"
#include "asciibar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace asciibar {
namespace common {

namespace {

bool readGlyph(const toml::value& section, const std::string& key, char& target) {
    if (!section.contains(key)) {
        return false;
    }

    std::string value = toml::find<std::string>(section, key);
    if (value.size() != 1) {
        Logger::instance().warn("[Config] Glyph ignored | key={} | value=\"{}\" | reason=not a single character",
                                key, value);
        return false;
    }

    target = value[0];
    return true;
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";

    config.bar = core::BarStyle{};
    config.bar.width = BAR_WIDTH;

    config.progress.refresh_interval_ms = REFRESH_INTERVAL_MS;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_ = config_file;

    if (config_file.empty()) {
        Logger::instance().debug("[Config] No config file | using defaults");
        return true;
    }

    return tryLoadTomlFile(config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }

    GlobalConfig loaded = global_;

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                loaded.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                if (level == "DEBUG") loaded.log_level = LogLevel::DEBUG;
                else if (level == "INFO") loaded.log_level = LogLevel::INFO;
                else if (level == "WARN") loaded.log_level = LogLevel::WARN;
                else if (level == "ERROR") loaded.log_level = LogLevel::ERROR;
                else Logger::instance().warn("[Config] Unknown log level | value={}", level);
            }
        }

        if (data.contains("bar")) {
            auto bar_section = data.at("bar");

            if (bar_section.contains("width")) {
                loaded.bar.width = toml::find<int>(bar_section, "width");
            }
            readGlyph(bar_section, "fill", loaded.bar.fill);
            readGlyph(bar_section, "head", loaded.bar.head);
            readGlyph(bar_section, "empty", loaded.bar.empty);
            readGlyph(bar_section, "left_end", loaded.bar.left_end);
            readGlyph(bar_section, "right_end", loaded.bar.right_end);
        }

        if (data.contains("progress")) {
            auto progress_section = data.at("progress");

            if (progress_section.contains("refresh_interval_ms")) {
                loaded.progress.refresh_interval_ms = toml::find<int>(progress_section, "refresh_interval_ms");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                loaded.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                loaded.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (format_str == "json") {
                    loaded.logging.format = LogFormat::JSON;
                } else {
                    loaded.logging.format = LogFormat::TEXT;
                }
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }

    global_ = loaded;
    Logger::instance().info("[Config] Loaded | path={} | width={}", path, global_.bar.width);
    return true;
}

const std::vector<std::string>& Config::keys() {
    static const std::vector<std::string> all_keys = {
        "global.log_level",
        "global.log_file",
        "bar.width",
        "bar.fill",
        "bar.head",
        "bar.empty",
        "bar.left_end",
        "bar.right_end",
        "progress.refresh_interval_ms",
        "logging.rotation_size_mb",
        "logging.max_files",
        "logging.format"
    };
    return all_keys;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "global.log_level") return to_string(global_.log_level);
    if (key == "global.log_file") return global_.log_file;
    if (key == "bar.width") return std::to_string(global_.bar.width);
    if (key == "bar.fill") return std::string(1, global_.bar.fill);
    if (key == "bar.head") return std::string(1, global_.bar.head);
    if (key == "bar.empty") return std::string(1, global_.bar.empty);
    if (key == "bar.left_end") return std::string(1, global_.bar.left_end);
    if (key == "bar.right_end") return std::string(1, global_.bar.right_end);
    if (key == "progress.refresh_interval_ms") return std::to_string(global_.progress.refresh_interval_ms);
    if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    if (key == "logging.format") return to_string(global_.logging.format);
    return std::nullopt;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

std::string to_string(LogFormat format) {
    switch (format) {
        case LogFormat::TEXT: return "text";
        case LogFormat::JSON: return "json";
        default: return "unknown";
    }
}

}}
