#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace asciibar {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    int bar_count_;
    int total_;
    int delay_ms_;
    bool json_output_ = false;
};

}}
