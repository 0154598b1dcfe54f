#include "asciibar/util/strutil.hpp"
#include <spdlog/fmt/fmt.h>

namespace asciibar {
namespace util {

std::string padLeft(const std::string& text, size_t width, char fill) {
    if (text.size() >= width) {
        return text;
    }
    return std::string(width - text.size(), fill) + text;
}

std::string padRight(const std::string& text, size_t width, char fill) {
    if (text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), fill);
}

std::string prettyTime(std::chrono::nanoseconds duration) {
    if (duration == std::chrono::nanoseconds::zero()) {
        return "---";
    }

    auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    std::string sign;
    if (total_seconds < 0) {
        sign = "-";
        total_seconds = -total_seconds;
    }

    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds % 3600) / 60;
    auto seconds = total_seconds % 60;

    if (hours > 0) {
        return fmt::format("{}{}h{}m{}s", sign, hours, minutes, seconds);
    }
    if (minutes > 0) {
        return fmt::format("{}{}m{}s", sign, minutes, seconds);
    }
    return fmt::format("{}{}s", sign, seconds);
}

}}
