#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace asciibar {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    
    static bool validateWidth(int width);
    static bool validateGlyph(char glyph);
};

}}
