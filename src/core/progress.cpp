#include "asciibar/core/progress.hpp"
#include "asciibar/common/logger.hpp"
#include <stdexcept>

namespace asciibar {
namespace core {

namespace {

constexpr const char* CURSOR_UP = "\033[1A";
constexpr const char* CLEAR_LINE = "\033[2K";

}

Progress::Progress(std::ostream& out, std::chrono::milliseconds refresh_interval,
                   const BarStyle& default_style)
    : out_(out),
      refresh_interval_(refresh_interval),
      default_style_(default_style) {
    if (refresh_interval_.count() <= 0) {
        throw std::invalid_argument("refresh interval must be positive");
    }
}

Progress::~Progress() {
    stop();
}

std::shared_ptr<Bar> Progress::addBar(int total) {
    return addBar(total, default_style_);
}

std::shared_ptr<Bar> Progress::addBar(int total, const BarStyle& style) {
    auto bar = std::make_shared<Bar>(total, style);
    
    std::lock_guard<std::mutex> lock(mutex_);
    bars_.push_back(bar);
    common::Logger::instance().debug("[Progress] Bar added | total={} | bars={}", total, bars_.size());
    return bar;
}

std::vector<std::shared_ptr<Bar>> Progress::bars() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bars_;
}

void Progress::render() {
    std::lock_guard<std::mutex> lock(mutex_);
    clearLocked();
    drawLocked();
}

void Progress::bypass(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    clearLocked();
    out_ << line << '\n';
    drawLocked();
}

void Progress::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    
    running_ = true;
    worker_ = std::thread(&Progress::refreshLoop, this);
    common::Logger::instance().debug("[Progress] Started | interval_ms={}", refresh_interval_.count());
}

void Progress::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    
    run_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    
    render();
    common::Logger::instance().debug("[Progress] Stopped");
}

bool Progress::isRunning() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return running_;
}

void Progress::clearLocked() {
    for (size_t i = 0; i < lines_drawn_; ++i) {
        out_ << CURSOR_UP << CLEAR_LINE;
    }
    lines_drawn_ = 0;
}

void Progress::drawLocked() {
    for (const auto& bar : bars_) {
        out_ << bar->toString() << '\n';
    }
    lines_drawn_ = bars_.size();
    out_ << std::flush;
}

void Progress::refreshLoop() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    while (!run_cv_.wait_for(lock, refresh_interval_, [this]() { return !running_; })) {
        lock.unlock();
        render();
        lock.lock();
    }
}

}}
