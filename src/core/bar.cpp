#include "asciibar/core/bar.hpp"
#include "asciibar/common/logger.hpp"
#include "asciibar/util/strutil.hpp"
#include <cmath>
#include <mutex>
#include <ostream>
#include <stdexcept>

namespace asciibar {
namespace core {

Bar::Bar(int total, const BarStyle& style)
    : total_(total),
      style_(style),
      unit_formatter_(format::defaultFormatter) {
    validateWidth(style_.width);
}

std::optional<BarErrorCode> Bar::set(int n) {
    std::unique_lock<std::shared_mutex> lock(mtx_);

    if (n > total_) {
        common::Logger::instance().debug("[Bar] Set rejected | n={} | total={}", n, total_);
        return BarErrorCode::MAX_CURRENT_EXCEEDED;
    }
    current_ = n;
    return std::nullopt;
}

bool Bar::incr() {
    std::unique_lock<std::shared_mutex> lock(mtx_);

    if (current_ >= total_) {
        return false;
    }

    auto now = Clock::now();
    if (!time_started_) {
        time_started_ = now;
    }
    time_elapsed_ = std::chrono::duration_cast<std::chrono::nanoseconds>(now - *time_started_);
    ++current_;
    return true;
}

int Bar::current() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return current_;
}

std::chrono::nanoseconds Bar::timeElapsed() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return time_elapsed_;
}

std::optional<Bar::Clock::time_point> Bar::timeStarted() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return time_started_;
}

Bar& Bar::appendFunc(DecoratorFunc f) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    append_funcs_.push_back(std::move(f));
    return *this;
}

Bar& Bar::appendCompleted() {
    return appendFunc([](const Bar& b) {
        return b.completedPercentString();
    });
}

Bar& Bar::appendElapsed() {
    return appendFunc([](const Bar& b) {
        return util::padLeft(b.timeElapsedString(), 5, ' ');
    });
}

Bar& Bar::prependFunc(DecoratorFunc f) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    prepend_funcs_.push_back(std::move(f));
    return *this;
}

Bar& Bar::prependCompleted() {
    return prependFunc([](const Bar& b) {
        return b.completedPercentString();
    });
}

Bar& Bar::prependElapsed() {
    return prependFunc([](const Bar& b) {
        return util::padLeft(b.timeElapsedString(), 5, ' ');
    });
}

BarStyle Bar::style() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return style_;
}

int Bar::width() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return style_.width;
}

Bar& Bar::setStyle(const BarStyle& style) {
    validateWidth(style.width);
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_ = style;
    return *this;
}

Bar& Bar::setWidth(int width) {
    validateWidth(width);
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.width = width;
    return *this;
}

Bar& Bar::setLeftEnd(char glyph) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.left_end = glyph;
    return *this;
}

Bar& Bar::setRightEnd(char glyph) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.right_end = glyph;
    return *this;
}

Bar& Bar::setFill(char glyph) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.fill = glyph;
    return *this;
}

Bar& Bar::setHead(char glyph) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.head = glyph;
    return *this;
}

Bar& Bar::setEmpty(char glyph) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    style_.empty = glyph;
    return *this;
}

Bar& Bar::setUnitFormatter(format::UnitFormatter formatter) {
    if (!formatter) {
        throw std::invalid_argument("unit formatter must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mtx_);
    unit_formatter_ = std::move(formatter);
    return *this;
}

double Bar::completedPercent() const {
    return percentOf(current(), total_);
}

std::string Bar::completedPercentString() const {
    return fmt::format("{:3.0f}%", completedPercent());
}

std::string Bar::timeElapsedString() const {
    return util::prettyTime(timeElapsed());
}

std::string Bar::formattedCurrent() const {
    format::UnitFormatter formatter;
    int value;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        formatter = unit_formatter_;
        value = current_;
    }
    return formatter(value);
}

std::string Bar::formattedTotal() const {
    format::UnitFormatter formatter;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        formatter = unit_formatter_;
    }
    return formatter(total_);
}

std::vector<char> Bar::bytes() const {
    BarStyle style;
    int current;
    std::vector<DecoratorFunc> append_funcs;
    std::vector<DecoratorFunc> prepend_funcs;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        style = style_;
        current = current_;
        append_funcs = append_funcs_;
        prepend_funcs = prepend_funcs_;
    }

    int completed_width = 0;
    if (current > 0) {
        completed_width = static_cast<int>(
            std::floor(style.width * (percentOf(current, total_) / 100.0)));
    }

    std::string pb(static_cast<size_t>(completed_width), style.fill);
    pb.append(static_cast<size_t>(style.width - completed_width), style.empty);

    if (completed_width > 0 && completed_width < style.width) {
        pb[completed_width - 1] = style.head;
    }

    pb.front() = style.left_end;
    pb.back() = style.right_end;

    for (const auto& f : append_funcs) {
        pb += ' ';
        pb += f(*this);
    }

    for (const auto& f : prepend_funcs) {
        pb = f(*this) + ' ' + pb;
    }

    return std::vector<char>(pb.begin(), pb.end());
}

std::string Bar::toString() const {
    auto b = bytes();
    return std::string(b.begin(), b.end());
}

double Bar::percentOf(int current, int total) {
    if (total <= 0) {
        return 0.0;
    }
    return (static_cast<double>(current) / static_cast<double>(total)) * 100.0;
}

void Bar::validateWidth(int width) {
    if (width <= 0) {
        throw std::invalid_argument("bar width must be positive, got " + std::to_string(width));
    }
}

std::ostream& operator<<(std::ostream& out, const Bar& bar) {
    return out << bar.toString();
}

}}
