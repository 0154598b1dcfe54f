#pragma once

#include <string>
#include <chrono>
#include <cstddef>

namespace asciibar {
namespace util {

// Pads on the left up to width bytes. Longer input is returned unchanged.
std::string padLeft(const std::string& text, size_t width, char fill = ' ');
std::string padRight(const std::string& text, size_t width, char fill = ' ');

// Whole seconds in XhYmZs form ("5s", "1m5s", "2h0m0s"); "---" for zero.
std::string prettyTime(std::chrono::nanoseconds duration);

}}
