#include "asciibar/format/units.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace asciibar {
namespace format {

std::string defaultFormatter(int value) {
    return std::to_string(value);
}

std::string bytesFormatter(int value) {
    if (value < 0) {
        return "0";
    }
    return formatByteCount(static_cast<uint64_t>(value));
}

std::string formatByteCount(uint64_t value) {
    if (value == 0) {
        return "0B";
    }

    double bytes = static_cast<double>(value);
    auto magnitude = static_cast<unsigned>(std::log2(bytes) / 10.0);

    switch (magnitude) {
        case 0: return fmt::format("{}B", value);
        case 1: return fmt::format("{:.2f}KiB", bytes / 1024.0);
        case 2: return fmt::format("{:.2f}MiB", bytes / (1024.0 * 1024.0));
        case 3: return fmt::format("{:.2f}GiB", bytes / (1024.0 * 1024.0 * 1024.0));
        default: return fmt::format("{:.2f}TiB", bytes / (1024.0 * 1024.0 * 1024.0 * 1024.0));
    }
}

}}
