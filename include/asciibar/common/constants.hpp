#pragma once

#include <string>
#include <cstddef>

namespace asciibar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("asciibar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "asciibar";
    constexpr const char* LOGGER_NAME = "asciibar";
}

namespace glyphs {
    constexpr char FILL = '=';
    constexpr char HEAD = '>';
    constexpr char EMPTY = '-';
    constexpr char LEFT_END = '[';
    constexpr char RIGHT_END = ']';
}

namespace limits {
    constexpr int DEFAULT_BAR_WIDTH = 70;
    constexpr int MAX_BAR_WIDTH = 1024;
    constexpr int DEFAULT_REFRESH_INTERVAL_MS = 10;
    constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 32 * 1024;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;
}

namespace config_defaults {
    constexpr int BAR_WIDTH = limits::DEFAULT_BAR_WIDTH;
    constexpr int REFRESH_INTERVAL_MS = limits::DEFAULT_REFRESH_INTERVAL_MS;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
    
    constexpr int DEMO_BARS = 3;
    constexpr int DEMO_TOTAL = 100;
    constexpr int DEMO_DELAY_MS = 20;
}

}
}
