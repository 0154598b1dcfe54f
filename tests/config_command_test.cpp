#include <gtest/gtest.h>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

#include "asciibar/common/config.hpp"
#include "cli/config_command.hpp"

namespace fs = std::filesystem;
using asciibar::cli::ConfigCommand;
using asciibar::common::Config;

namespace {

// Redirects a stream into a string buffer for the lifetime of the object.
class Capture {
public:
  explicit Capture(std::ostream& stream) : stream_(stream), saved_(stream.rdbuf(buffer_.rdbuf())) {}
  ~Capture() { stream_.rdbuf(saved_); }

  std::string str() const { return buffer_.str(); }

private:
  std::ostream& stream_;
  std::ostringstream buffer_;
  std::streambuf* saved_;
};

class ConfigCommandTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() / ("asciibar-cli-" + std::to_string(rd()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    Config::instance().load();
  }

  std::string write(const std::string& contents) {
    fs::path path = dir_ / "config.toml";
    std::ofstream of(path.string());
    of << contents;
    of.close();
    return path.string();
  }

  int run(const std::string& args) {
    CLI::App app;
    ConfigCommand command;
    command.setup(app.add_subcommand("config"));
    app.parse(args);
    return command.execute();
  }

  fs::path dir_;
};

} // anonymous namespace

TEST_F(ConfigCommandTest, show_prints_sample_bar) {
  ASSERT_TRUE(Config::instance().load(write("[bar]\nwidth = 10\n")));

  Capture out(std::cout);
  EXPECT_EQ(run("config show"), 0);
  EXPECT_NE(out.str().find("Sample: [===>----]  50%"), std::string::npos);
}

TEST_F(ConfigCommandTest, show_reports_invalid_width) {
  ASSERT_TRUE(Config::instance().load(write("[bar]\nwidth = 0\n")));

  Capture out(std::cout);
  Capture err(std::cerr);
  int rc = 0;
  EXPECT_NO_THROW({ rc = run("config show"); });
  EXPECT_EQ(rc, 1);
  EXPECT_NE(err.str().find("bar.width"), std::string::npos);
  EXPECT_EQ(out.str().find("Sample:"), std::string::npos);
}
