#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "asciibar/core/progress.hpp"

using asciibar::core::BarStyle;
using asciibar::core::Progress;

namespace {

const std::string REDRAW_LINE = "\033[1A\033[2K";

BarStyle narrow() {
  BarStyle style;
  style.width = 10;
  return style;
}

} // anonymous namespace

TEST(Progress, renders_one_line_per_bar) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(10), narrow());

  auto first = progress.addBar(10);
  auto second = progress.addBar(10);
  ASSERT_FALSE(first->set(5).has_value());
  ASSERT_FALSE(second->set(10).has_value());

  progress.render();

  EXPECT_EQ(out.str(), "[===>----]\n[========]\n");
  EXPECT_EQ(progress.bars().size(), 2u);
}

TEST(Progress, redraw_clears_previous_lines) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(10), narrow());

  auto bar = progress.addBar(10);
  progress.render();
  ASSERT_FALSE(bar->set(10).has_value());
  progress.render();

  EXPECT_EQ(out.str(), "[--------]\n" + REDRAW_LINE + "[========]\n");
}

TEST(Progress, bypass_prints_above_bars) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(10), narrow());

  progress.addBar(10);
  progress.render();
  progress.bypass("log line");

  EXPECT_EQ(out.str(), "[--------]\n" + REDRAW_LINE + "log line\n[--------]\n");
}

TEST(Progress, bars_are_shared) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(10), narrow());

  auto bar = progress.addBar(3);
  ASSERT_TRUE(bar->incr());

  auto bars = progress.bars();
  ASSERT_EQ(bars.size(), 1u);
  EXPECT_EQ(bars[0], bar);
  EXPECT_EQ(bars[0]->current(), 1);
}

TEST(Progress, explicit_style_overrides_default) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(10), narrow());

  BarStyle style = narrow();
  style.width = 4;
  auto bar = progress.addBar(2, style);

  EXPECT_EQ(bar->width(), 4);
  EXPECT_EQ(progress.addBar(2)->width(), 10);
}

TEST(Progress, start_and_stop_refresh) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(1), narrow());

  auto bar = progress.addBar(10);
  progress.start();
  progress.start();
  EXPECT_TRUE(progress.isRunning());

  while (bar->incr()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  progress.stop();
  progress.stop();
  EXPECT_FALSE(progress.isRunning());

  const std::string text = out.str();
  const std::string last = "[========]\n";
  ASSERT_GE(text.size(), last.size());
  EXPECT_EQ(text.substr(text.size() - last.size()), last);
}

TEST(Progress, restart_after_stop) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(1), narrow());
  progress.addBar(1);

  progress.start();
  progress.stop();
  progress.start();
  EXPECT_TRUE(progress.isRunning());
}

TEST(Progress, concurrent_start_and_stop) {
  std::ostringstream out;
  Progress progress(out, std::chrono::milliseconds(1), narrow());
  progress.addBar(1);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&progress]() {
      for (int i = 0; i < 50; ++i) {
        progress.start();
        progress.stop();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_FALSE(progress.isRunning());
}

TEST(Progress, rejects_non_positive_interval) {
  std::ostringstream out;
  EXPECT_THROW({ Progress progress(out, std::chrono::milliseconds(0)); }, std::invalid_argument);
}
