// Inspector settings file parsing and logger setup.
#include <gtest/gtest.h>
#include <model_config/settings.hpp>
#include <metamodel/log.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using model_config::Settings;

TEST(SettingsTest, ReadsLoggingSectionAndSample)
{
    std::istringstream in(R"({
        "logging": { "level": "debug", "file": "logs/inspector.log", "pattern": "%v" },
        "sample": "game"
    })");
    auto settings = model_config::load_settings_from_json(in);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->log_level, "debug");
    EXPECT_EQ(settings->log_file, "logs/inspector.log");
    EXPECT_EQ(settings->log_pattern, "%v");
    EXPECT_EQ(settings->sample, "game");
}

TEST(SettingsTest, MissingOrMistypedKeysKeepDefaults)
{
    std::istringstream in(R"({ "logging": { "level": 3 }, "sample": null, "extra": true })");
    auto settings = model_config::load_settings_from_json(in);
    ASSERT_TRUE(settings.has_value());

    const Settings defaults;
    EXPECT_EQ(settings->log_level, defaults.log_level);
    EXPECT_EQ(settings->log_file, "");
    EXPECT_EQ(settings->log_pattern, defaults.log_pattern);
    EXPECT_EQ(settings->sample, "library");
}

TEST(SettingsTest, MalformedDocumentYieldsNothing)
{
    std::istringstream broken(R"({ "logging": )");
    EXPECT_FALSE(model_config::load_settings_from_json(broken).has_value());

    std::istringstream array("[1, 2, 3]");
    EXPECT_FALSE(model_config::load_settings_from_json(array).has_value());

    EXPECT_FALSE(model_config::load_settings_from_json_file("/nonexistent/inspector.json").has_value());
}

TEST(SettingsTest, LogLevelNames)
{
    EXPECT_EQ(model_config::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(model_config::parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(model_config::parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(model_config::parse_log_level("loud"), spdlog::level::info);
    EXPECT_EQ(model_config::parse_log_level(""), spdlog::level::info);
}

TEST(SettingsTest, ConfigureLoggingInstallsFileLogger)
{
    const auto dir = std::filesystem::temp_directory_path() / "uml_structure_settings_test";
    std::filesystem::remove_all(dir);

    Settings settings;
    settings.log_level = "debug";
    settings.log_file = (dir / "inspector.log").string();
    settings.log_pattern = "%l %v";

    auto logger = model_config::configure_logging(settings);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(metamodel::logger(), logger);
    EXPECT_EQ(logger->level(), spdlog::level::debug);

    logger->info("settings test marker");
    logger->flush();

    std::ifstream log(settings.log_file);
    ASSERT_TRUE(log.good());
    const std::string contents((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("info settings test marker"), std::string::npos);

    metamodel::set_logger(nullptr);
    logger.reset();
    std::filesystem::remove_all(dir);
}
