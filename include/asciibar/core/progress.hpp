#pragma once

#include "bar.hpp"
#include "bar_style.hpp"
#include "../common/constants.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace asciibar {
namespace core {

// Owns a group of bars and redraws them in place, one per line.
class Progress {
public:
    explicit Progress(std::ostream& out,
                      std::chrono::milliseconds refresh_interval =
                          std::chrono::milliseconds(constants::limits::DEFAULT_REFRESH_INTERVAL_MS),
                      const BarStyle& default_style = BarStyle{});
    ~Progress();

    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;

    std::shared_ptr<Bar> addBar(int total);
    std::shared_ptr<Bar> addBar(int total, const BarStyle& style);
    std::vector<std::shared_ptr<Bar>> bars() const;

    // Rewrites the region drawn by the previous render.
    void render();

    // Prints a line above the bars without breaking the redraw region.
    void bypass(const std::string& line);

    void start();
    void stop();
    bool isRunning() const;

private:
    std::ostream& out_;
    std::chrono::milliseconds refresh_interval_;
    BarStyle default_style_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Bar>> bars_;
    size_t lines_drawn_ = 0;

    // Held across the whole of start() and stop(), including the join.
    std::mutex lifecycle_mutex_;
    mutable std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_ = false;
    std::thread worker_;

    void clearLocked();
    void drawLocked();
    void refreshLoop();
};

}}
