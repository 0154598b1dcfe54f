#include "asciibar/config/validator.hpp"
#include "asciibar/common/constants.hpp"
#include "asciibar/common/logger.hpp"
#include <filesystem>
#include <utility>

namespace asciibar {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (!validateWidth(config.bar.width)) {
        result.errors.push_back("bar.width: Must be between 1-" +
                                std::to_string(constants::limits::MAX_BAR_WIDTH));
        result.is_valid = false;
    } else if (config.bar.width < 3) {
        result.warnings.push_back("bar.width: Below 3 the end glyphs cover every fill cell");
    }
    
    const std::pair<const char*, char> glyphs[] = {
        {"bar.fill", config.bar.fill},
        {"bar.head", config.bar.head},
        {"bar.empty", config.bar.empty},
        {"bar.left_end", config.bar.left_end},
        {"bar.right_end", config.bar.right_end}
    };
    for (const auto& [key, glyph] : glyphs) {
        if (!validateGlyph(glyph)) {
            result.errors.push_back(std::string(key) + ": Must be a printable ASCII character");
            result.is_valid = false;
        }
    }
    
    if (config.bar.fill == config.bar.empty) {
        result.warnings.push_back("bar.fill: Same as bar.empty, progress will not be visible");
    }
    
    if (config.progress.refresh_interval_ms <= 0) {
        result.errors.push_back("progress.refresh_interval_ms: Must be positive");
        result.is_valid = false;
    }
    
    if (config.logging.max_files == 0) {
        result.errors.push_back("logging.max_files: Must be at least 1");
        result.is_valid = false;
    }
    
    if (!config.log_file.empty()) {
        auto parent = std::filesystem::path(config.log_file).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            result.warnings.push_back("global.log_file: Parent directory does not exist and will be created");
        }
    }
    
    common::Logger::instance().debug("[Validator] Complete | valid={} | errors={} | warnings={}",
                                     result.is_valid, result.errors.size(), result.warnings.size());
    return result;
}

bool ConfigValidator::validateWidth(int width) {
    return width > 0 && width <= constants::limits::MAX_BAR_WIDTH;
}

bool ConfigValidator::validateGlyph(char glyph) {
    return glyph >= 0x20 && glyph < 0x7F;
}

}}
