#pragma once

#include "bar_style.hpp"
#include "error_codes.hpp"
#include "../format/units.hpp"
#include <chrono>
#include <functional>
#include <iosfwd>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace asciibar {
namespace core {

// Thread-safe. Decorators run without the lock held.
// Elapsed time is only refreshed by incr(), never by set().
class Bar {
public:
    using Clock = std::chrono::steady_clock;
    using DecoratorFunc = std::function<std::string(const Bar&)>;

    explicit Bar(int total, const BarStyle& style = BarStyle{});

    Bar(const Bar&) = delete;
    Bar& operator=(const Bar&) = delete;

    // Returns MAX_CURRENT_EXCEEDED and leaves the bar untouched when n > total.
    std::optional<BarErrorCode> set(int n);

    // Advances by one. Returns false once the total has been reached.
    bool incr();

    int current() const;
    int total() const { return total_; }
    std::chrono::nanoseconds timeElapsed() const;
    std::optional<Clock::time_point> timeStarted() const;

    Bar& appendFunc(DecoratorFunc f);
    Bar& appendCompleted();
    Bar& appendElapsed();
    Bar& prependFunc(DecoratorFunc f);
    Bar& prependCompleted();
    Bar& prependElapsed();

    BarStyle style() const;
    int width() const;
    Bar& setStyle(const BarStyle& style);
    Bar& setWidth(int width);
    Bar& setLeftEnd(char glyph);
    Bar& setRightEnd(char glyph);
    Bar& setFill(char glyph);
    Bar& setHead(char glyph);
    Bar& setEmpty(char glyph);
    Bar& setUnitFormatter(format::UnitFormatter formatter);

    // 0 when total <= 0.
    double completedPercent() const;
    std::string completedPercentString() const;
    std::string timeElapsedString() const;
    std::string formattedCurrent() const;
    std::string formattedTotal() const;

    std::vector<char> bytes() const;
    std::string toString() const;

private:
    mutable std::shared_mutex mtx_;

    const int total_;
    BarStyle style_;
    format::UnitFormatter unit_formatter_;

    int current_ = 0;
    std::optional<Clock::time_point> time_started_;
    std::chrono::nanoseconds time_elapsed_{0};

    std::vector<DecoratorFunc> append_funcs_;
    std::vector<DecoratorFunc> prepend_funcs_;

    static double percentOf(int current, int total);
    static void validateWidth(int width);
};

std::ostream& operator<<(std::ostream& out, const Bar& bar);

}}
