#include "copy_command.hpp"
#include "asciibar/common/config.hpp"
#include "asciibar/common/logger.hpp"
#include "asciibar/core/progress.hpp"
#include "asciibar/core/stream_progressor.hpp"
#include "asciibar/format/json_formatter.hpp"
#include "asciibar/format/units.hpp"
#include "asciibar/util/strutil.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdint>
#include <limits>
#include <unistd.h>

namespace asciibar {
namespace cli {

CopyCommand::CopyCommand() = default;

void CopyCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("source", source_, "File to copy")
        ->required()
        ->check(CLI::ExistingFile);
    subcommand->add_option("destination", destination_, "Destination path")->required();
    subcommand->add_flag("--json", json_output_, "Print a JSON summary when done");
    subcommand->add_flag("-q,--quiet", quiet_, "Do not draw the progress bar");
    
    subcommand->callback([this]() { was_called_ = true; });
}

int CopyCommand::execute() {
    const auto& config = common::Config::instance().global();
    
    std::error_code ec;
    auto size = std::filesystem::file_size(source_, ec);
    if (ec) {
        std::cerr << "Error: Cannot stat " << source_ << ": " << ec.message() << "\n";
        return 1;
    }
    if (size > static_cast<uintmax_t>(std::numeric_limits<int>::max())) {
        std::cerr << "Error: " << source_ << " is too large to track ("
                  << format::bytesFormatter(std::numeric_limits<int>::max()) << " max)\n";
        return 1;
    }
    
    std::ifstream input(source_, std::ios::binary);
    if (!input) {
        std::cerr << "Error: Cannot open " << source_ << "\n";
        return 1;
    }
    std::ofstream output(destination_, std::ios::binary | std::ios::trunc);
    if (!output) {
        std::cerr << "Error: Cannot create " << destination_ << "\n";
        return 1;
    }
    
    bool draw = !quiet_ && isatty(STDOUT_FILENO);
    
    core::Progress progress(std::cout,
                            std::chrono::milliseconds(config.progress.refresh_interval_ms),
                            config.bar);
    auto bar = progress.addBar(static_cast<int>(size));
    bar->setUnitFormatter(format::bytesFormatter);
    bar->appendCompleted()
        .appendFunc([](const core::Bar& b) {
            return util::padLeft(b.formattedCurrent(), 10, ' ') + " / " + b.formattedTotal();
        })
        .prependElapsed();
    
    common::Logger::instance().info("[Copy] Starting | source={} | destination={} | size={}",
                                    source_, destination_, size);
    
    if (draw) {
        progress.start();
    }
    
    core::IstreamByteSource source(input);
    core::StreamProgressor progressor(*bar, source);
    auto result = core::copyThrough(progressor, output);
    
    if (draw) {
        progress.stop();
    }
    
    output.close();
    if (!output) {
        result.success = false;
        result.error_message = "Failed to flush destination";
    }
    
    if (json_output_) {
        format::JsonFormatter formatter;
        auto summary = formatter.toJson(*bar);
        summary["success"] = result.success;
        summary["bytes_copied"] = result.bytes_copied;
        if (!result.success) {
            summary["error"] = result.error_message;
        }
        std::cout << summary.dump() << "\n";
    }
    
    if (!result.success) {
        std::cerr << "Error: Copy failed after " << format::formatByteCount(result.bytes_copied)
                  << ": " << result.error_message << "\n";
        return 1;
    }
    
    common::Logger::instance().info("[Copy] Complete | bytes={}", result.bytes_copied);
    return 0;
}

}}
