#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace asciibar {
namespace cli {

class CopyCommand : public MainCommand {
public:
    CopyCommand();
    
    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    std::string source_;
    std::string destination_;
    bool json_output_ = false;
    bool quiet_ = false;
};

}}
