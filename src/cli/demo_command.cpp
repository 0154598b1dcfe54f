#include "demo_command.hpp"
#include "asciibar/common/config.hpp"
#include "asciibar/common/constants.hpp"
#include "asciibar/common/logger.hpp"
#include "asciibar/core/progress.hpp"
#include "asciibar/format/json_formatter.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

namespace asciibar {
namespace cli {

DemoCommand::DemoCommand()
    : bar_count_(constants::config_defaults::DEMO_BARS),
      total_(constants::config_defaults::DEMO_TOTAL),
      delay_ms_(constants::config_defaults::DEMO_DELAY_MS) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--bars", bar_count_, "Number of bars")
        ->check(CLI::Range(1, 32));
    subcommand->add_option("-t,--total", total_, "Steps per bar")
        ->check(CLI::PositiveNumber);
    subcommand->add_option("--delay-ms", delay_ms_, "Maximum delay between steps")
        ->check(CLI::NonNegativeNumber);
    subcommand->add_flag("--json", json_output_, "Print a JSON summary per bar when done");
    
    subcommand->callback([this]() { was_called_ = true; });
}

int DemoCommand::execute() {
    const auto& config = common::Config::instance().global();
    
    core::Progress progress(std::cout,
                            std::chrono::milliseconds(config.progress.refresh_interval_ms),
                            config.bar);
    
    std::vector<std::shared_ptr<core::Bar>> bars;
    for (int i = 0; i < bar_count_; ++i) {
        auto bar = progress.addBar(total_);
        std::string label = "task " + std::to_string(i + 1);
        bar->appendCompleted()
            .prependElapsed()
            .prependFunc([label](const core::Bar&) { return label; });
        bars.push_back(bar);
    }
    
    common::Logger::instance().info("[Demo] Starting | bars={} | total={}", bar_count_, total_);
    progress.start();
    
    std::vector<std::thread> workers;
    for (size_t i = 0; i < bars.size(); ++i) {
        workers.emplace_back([bar = bars[i], seed = i, delay = delay_ms_]() {
            std::mt19937 rng(static_cast<unsigned>(seed) + 1);
            std::uniform_int_distribution<int> jitter(0, delay);
            while (bar->incr()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(jitter(rng)));
            }
        });
    }
    
    for (auto& worker : workers) {
        worker.join();
    }
    progress.stop();
    
    if (json_output_) {
        format::JsonFormatter formatter;
        for (const auto& bar : bars) {
            std::cout << formatter.format(*bar) << "\n";
        }
    }
    
    common::Logger::instance().info("[Demo] Complete");
    return 0;
}

}}
