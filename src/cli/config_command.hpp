#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace asciibar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    CLI::App* show_cmd_ = nullptr;
    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;
    CLI::App* validate_cmd_ = nullptr;
    
    int executeShow();
    int executeGet();
    int executeValidate();
};

}}
