#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "asciibar/common/config.hpp"
#include "asciibar/config/validator.hpp"

namespace fs = std::filesystem;
using asciibar::common::Config;
using asciibar::common::GlobalConfig;
using asciibar::common::LogFormat;
using asciibar::common::LogLevel;
using asciibar::config::ConfigValidator;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() / ("asciibar-config-" + std::to_string(rd()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    Config::instance().load();
  }

  std::string write(const std::string& name, const std::string& contents) {
    fs::path path = dir_ / name;
    std::ofstream of(path.string());
    of << contents;
    of.close();
    return path.string();
  }

  fs::path dir_;
};

} // anonymous namespace

TEST(Config, defaults) {
  GlobalConfig config = Config::createDefaultConfig();

  EXPECT_EQ(config.bar.width, 70);
  EXPECT_EQ(config.bar.fill, '=');
  EXPECT_EQ(config.bar.head, '>');
  EXPECT_EQ(config.bar.empty, '-');
  EXPECT_EQ(config.bar.left_end, '[');
  EXPECT_EQ(config.bar.right_end, ']');
  EXPECT_EQ(config.progress.refresh_interval_ms, 10);
  EXPECT_EQ(config.log_level, LogLevel::INFO);
  EXPECT_EQ(config.logging.format, LogFormat::TEXT);
}

TEST(Config, empty_path_keeps_defaults) {
  auto& config = Config::instance();

  EXPECT_TRUE(config.load(""));
  EXPECT_EQ(config.global().bar.width, 70);
  EXPECT_EQ(config.getConfigPath(), "");
}

TEST_F(ConfigFileTest, loads_toml_sections) {
  auto path = write("asciibar.toml", R"(
[global]
log_level = "DEBUG"

[bar]
width = 40
fill = "#"
head = "@"
empty = "."
left_end = "|"
right_end = "|"

[progress]
refresh_interval_ms = 250

[logging]
max_files = 2
format = "json"
)");

  auto& config = Config::instance();
  ASSERT_TRUE(config.load(path));

  const auto& global = config.global();
  EXPECT_EQ(global.log_level, LogLevel::DEBUG);
  EXPECT_EQ(global.bar.width, 40);
  EXPECT_EQ(global.bar.fill, '#');
  EXPECT_EQ(global.bar.head, '@');
  EXPECT_EQ(global.bar.empty, '.');
  EXPECT_EQ(global.bar.left_end, '|');
  EXPECT_EQ(global.bar.right_end, '|');
  EXPECT_EQ(global.progress.refresh_interval_ms, 250);
  EXPECT_EQ(global.logging.max_files, 2u);
  EXPECT_EQ(global.logging.format, LogFormat::JSON);
  EXPECT_EQ(config.getConfigPath(), path);
}

TEST_F(ConfigFileTest, multi_character_glyph_is_ignored) {
  auto path = write("glyph.toml", R"(
[bar]
fill = "##"
empty = "_"
)");

  auto& config = Config::instance();
  ASSERT_TRUE(config.load(path));

  EXPECT_EQ(config.global().bar.fill, '=');
  EXPECT_EQ(config.global().bar.empty, '_');
}

TEST_F(ConfigFileTest, missing_file_fails_with_defaults) {
  auto& config = Config::instance();

  EXPECT_FALSE(config.load((dir_ / "absent.toml").string()));
  EXPECT_EQ(config.global().bar.width, 70);
}

TEST_F(ConfigFileTest, malformed_file_fails_with_defaults) {
  auto path = write("broken.toml", "[bar\nwidth = = 3\n");

  auto& config = Config::instance();
  EXPECT_FALSE(config.load(path));
  EXPECT_EQ(config.global().bar.width, 70);
}

TEST_F(ConfigFileTest, wrong_type_fails_with_defaults) {
  auto path = write("types.toml", "[bar]\nwidth = \"wide\"\nfill = \"#\"\n");

  auto& config = Config::instance();
  EXPECT_FALSE(config.load(path));
  EXPECT_EQ(config.global().bar.width, 70);
  EXPECT_EQ(config.global().bar.fill, '=');
}

TEST(Config, get_value) {
  auto& config = Config::instance();
  ASSERT_TRUE(config.load());

  EXPECT_EQ(config.getValue("bar.width"), "70");
  EXPECT_EQ(config.getValue("bar.head"), ">");
  EXPECT_EQ(config.getValue("global.log_level"), "INFO");
  EXPECT_EQ(config.getValue("logging.format"), "text");
  EXPECT_FALSE(config.getValue("bar.colour").has_value());

  for (const auto& key : Config::keys()) {
    EXPECT_TRUE(config.getValue(key).has_value()) << key;
  }
}

TEST(ConfigValidator, defaults_are_valid) {
  ConfigValidator validator;
  auto result = validator.validate(Config::createDefaultConfig());

  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.errors.empty());
}

TEST(ConfigValidator, rejects_bad_values) {
  GlobalConfig config = Config::createDefaultConfig();
  config.bar.width = 0;
  config.bar.head = '\n';
  config.progress.refresh_interval_ms = 0;

  ConfigValidator validator;
  auto result = validator.validate(config);

  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.errors.size(), 3u);
}

TEST(ConfigValidator, warns_on_invisible_progress) {
  GlobalConfig config = Config::createDefaultConfig();
  config.bar.fill = config.bar.empty;
  config.bar.width = 2;

  ConfigValidator validator;
  auto result = validator.validate(config);

  EXPECT_TRUE(result.is_valid);
  EXPECT_EQ(result.warnings.size(), 2u);
}
