#include "asciibar/format/json_formatter.hpp"
#include <chrono>

namespace asciibar {
namespace format {

nlohmann::json JsonFormatter::toJson(const core::Bar& bar) const {
    nlohmann::json j;
    
    j["current"] = bar.current();
    j["total"] = bar.total();
    j["percent"] = bar.completedPercent();
    j["elapsed_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(bar.timeElapsed()).count();
    j["rendered"] = bar.toString();
    
    return j;
}

std::string JsonFormatter::format(const core::Bar& bar, int indent) const {
    return toJson(bar).dump(indent);
}

}}
