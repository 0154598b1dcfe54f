#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "asciibar/common/config.hpp"
#include "asciibar/common/constants.hpp"
#include "asciibar/common/logger.hpp"
#include "asciibar/config/validator.hpp"
#include "cli/config_command.hpp"
#include "cli/copy_command.hpp"
#include "cli/demo_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{asciibar::constants::system::APPLICATION_NAME, "asciibar"};
        app.set_version_flag("--version,-v", asciibar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        bool verbose = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--verbose", verbose, "Enable debug logging");
        
        auto config_cmd = std::make_unique<asciibar::cli::ConfigCommand>();
        auto demo_cmd = std::make_unique<asciibar::cli::DemoCommand>();
        auto copy_cmd = std::make_unique<asciibar::cli::CopyCommand>();
        
        config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));
        demo_cmd->setup(app.add_subcommand("demo", "Drive several bars from worker threads"));
        copy_cmd->setup(app.add_subcommand("copy", "Copy a file with a byte progress bar"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = asciibar::common::Config::instance();
        bool loaded = config.load(config_file);
        
        const auto& global = config.global();
        auto level = verbose ? asciibar::common::LogLevel::DEBUG : global.log_level;
        asciibar::common::Logger::instance().initialize(
            global.log_file.empty() ? asciibar::common::LogMode::CONSOLE_ONLY
                                    : asciibar::common::LogMode::FILE_ONLY,
            global.log_file,
            level,
            global.logging
        );
        
        if (!loaded) {
            std::cerr << "Error: Failed to load configuration: " << config_file << "\n";
            return 1;
        }
        
        if (!config_cmd->wasCalled()) {
            asciibar::config::ConfigValidator validator;
            auto validation = validator.validate(global);
            if (!validation.is_valid) {
                for (const auto& error : validation.errors) {
                    std::cerr << "Config error: " << error << "\n";
                }
                return 1;
            }
        }
        
        int rc = 0;
        if (config_cmd->wasCalled()) {
            rc = config_cmd->execute();
        } else if (demo_cmd->wasCalled()) {
            rc = demo_cmd->execute();
        } else if (copy_cmd->wasCalled()) {
            rc = copy_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        asciibar::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
