#pragma once

#include "../core/bar.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace asciibar {
namespace format {

class JsonFormatter {
public:
    // {current, total, percent, elapsed_ms, rendered}
    nlohmann::json toJson(const core::Bar& bar) const;
    std::string format(const core::Bar& bar, int indent = -1) const;
};

}}
