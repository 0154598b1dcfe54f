#include "config_command.hpp"
#include "asciibar/common/config.hpp"
#include "asciibar/config/validator.hpp"
#include "asciibar/core/bar.hpp"
#include <iomanip>
#include <iostream>

namespace asciibar {
namespace cli {

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->require_subcommand(1);
    
    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (section.name)")->required();
    get_cmd_->callback([this]() { was_called_ = true; });
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (show_cmd_->parsed()) {
        return executeShow();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }
    return 1;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    
    const auto& path = config.getConfigPath();
    std::cout << "Config file: " << (path.empty() ? "(defaults)" : path) << "\n\n";
    
    for (const auto& key : common::Config::keys()) {
        auto value = config.getValue(key);
        std::cout << "  " << std::left << std::setw(30) << key << (value ? *value : "(not set)") << "\n";
    }
    
    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "Config error: " << error << "\n";
        }
        return 1;
    }
    
    core::Bar sample(10, config.global().bar);
    if (sample.set(5)) {
        return 1;
    }
    std::cout << "\nSample: " << sample.appendCompleted() << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    auto value = common::Config::instance().getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeValidate() {
    config::ConfigValidator validator;
    auto result = validator.validate(common::Config::instance().global());
    
    for (const auto& error : result.errors) {
        std::cout << "\033[31mError:\033[0m " << error << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "\033[33mWarning:\033[0m " << warning << "\n";
    }
    
    if (result.is_valid) {
        std::cout << "Configuration is valid\n";
        return 0;
    }
    return 1;
}

}}
