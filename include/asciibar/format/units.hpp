#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace asciibar {
namespace format {

using UnitFormatter = std::function<std::string(int)>;

std::string defaultFormatter(int value);

// Binary magnitudes: "512B", "1.50KiB", "2.00MiB", ... up to TiB.
std::string bytesFormatter(int value);
std::string formatByteCount(uint64_t bytes);

}}
