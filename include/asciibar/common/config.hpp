#pragma once

#include "../core/bar_style.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace asciibar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ProgressConfig {
    int refresh_interval_ms;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    core::BarStyle bar;
    ProgressConfig progress;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();
    static GlobalConfig createDefaultConfig();
    
    // An empty path keeps the defaults. A named file that is missing or
    // malformed leaves the defaults in place and returns false.
    bool load(const std::string& config_file = "");
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::optional<std::string> getValue(const std::string& key) const;
    static const std::vector<std::string>& keys();
    
    const std::string& getConfigPath() const { return current_config_path_; }

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

std::string to_string(LogLevel level);
std::string to_string(LogFormat format);

}}
