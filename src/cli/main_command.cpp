#include "main_command.hpp"

namespace asciibar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::wasCalled() const {
    return was_called_;
}

}}
