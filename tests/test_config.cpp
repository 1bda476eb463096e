#include <gtest/gtest.h>
#include "core/config/config_manager.hpp"
#include "common/error.hpp"
#include "common/logging.hpp"
#include <filesystem>
#include <fstream>

using namespace wordguard;
using namespace wordguard::common;

TEST(DetectorOptionsTest, DefaultValues) {
    DetectorOptions options;

    EXPECT_TRUE(options.sanitize_special_characters);
    EXPECT_TRUE(options.sanitize_leet_speak);
    EXPECT_TRUE(options.sanitize_accents);
    EXPECT_TRUE(options.sanitize_spaces);
    EXPECT_FALSE(options.exact_word);
    EXPECT_NO_THROW(options.validate());
}

TEST(DetectorOptionsTest, ValidationChecks) {
    DetectorOptions options;
    options.exact_word = true;
    EXPECT_THROW(options.validate(), ConfigException);

    options.sanitize_spaces = false;
    EXPECT_NO_THROW(options.validate());
}

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_path = std::filesystem::temp_directory_path() /
                      ("wordguard_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(config_path, ec);
    }

    ConfigManager manager;
    std::filesystem::path config_path;
};

TEST_F(ConfigManagerTest, DefaultValues) {
    const DetectorConfig& config = manager.get_config();

    EXPECT_EQ(config.options, DetectorOptions());
    EXPECT_FALSE(config.use_custom_replacements);
    EXPECT_EQ(config.logging.level, LogLevel::WARNING);
    EXPECT_FALSE(config.logging.file_output);
    EXPECT_TRUE(manager.validate_configurations());
}

TEST_F(ConfigManagerTest, LoadFromString) {
    manager.load_from_string(R"({
        "sanitizer": {"special_characters": false, "leet_speak": true, "accents": false, "spaces": false},
        "matcher": {"exact_word": true},
        "logging": {"level": "DEBUG", "console_output": false}
    })");

    const DetectorOptions& options = manager.get_options();
    EXPECT_FALSE(options.sanitize_special_characters);
    EXPECT_TRUE(options.sanitize_leet_speak);
    EXPECT_FALSE(options.sanitize_accents);
    EXPECT_FALSE(options.sanitize_spaces);
    EXPECT_TRUE(options.exact_word);

    EXPECT_EQ(manager.get_log_config().level, LogLevel::DEBUG);
    EXPECT_FALSE(manager.get_log_config().console_output);
}

TEST_F(ConfigManagerTest, LoadCharacterReplacements) {
    manager.load_from_string(R"({"character_replacements": {"9": "g", "\u00a7": "s", "^": " "}})");

    const DetectorConfig& config = manager.get_config();
    ASSERT_TRUE(config.use_custom_replacements);
    EXPECT_EQ(config.custom_replacements.size(), 3u);
    EXPECT_TRUE(config.custom_replacements.is_leet(U'9'));
    EXPECT_TRUE(config.custom_replacements.is_leet(U'\u00A7'));
    EXPECT_TRUE(config.custom_replacements.is_special(U'^'));
}

TEST_F(ConfigManagerTest, InvalidConfigurationsKeepPreviousState) {
    EXPECT_THROW(manager.load_from_string("{ not json"), ConfigException);
    EXPECT_THROW(manager.load_from_string("[1, 2]"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"matcher": {"exact_word": true}})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"sanitizer": {"spaces": "yes"}})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"character_replacements": {"ab": "c"}})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"character_replacements": {"a": ""}})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"character_replacements": ["a"]})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"logging": {"level": "LOUD"}})"), ConfigException);
    EXPECT_THROW(manager.load_from_string(R"({"logging": {"max_files": 0}})"), ConfigException);

    EXPECT_EQ(manager.get_options(), DetectorOptions());
    EXPECT_FALSE(manager.get_config().use_custom_replacements);
    EXPECT_EQ(manager.get_log_config().level, LogLevel::WARNING);
}

TEST_F(ConfigManagerTest, ValidationErrorsAreReported) {
    try {
        manager.load_from_string(R"({"matcher": {"exact_word": true}})");
        FAIL() << "Expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_CONFIG);
        EXPECT_NE(std::string(e.what()).find("exact_word"), std::string::npos);
    }
}

TEST_F(ConfigManagerTest, SaveAndLoadFile) {
    DetectorOptions options;
    options.sanitize_accents = false;
    options.exact_word = true;
    options.sanitize_spaces = false;
    manager.update_options(options);
    manager.set_custom_replacements(ReplacementTable(ReplacementTable::Map{{U'9', U'g'}}));
    manager.update_param("log_level", "ERROR");
    manager.save_to_file(config_path.string());

    ConfigManager loaded;
    loaded.load_from_file(config_path.string());

    EXPECT_EQ(loaded.get_options(), options);
    ASSERT_TRUE(loaded.get_config().use_custom_replacements);
    EXPECT_EQ(loaded.get_config().custom_replacements, ReplacementTable(ReplacementTable::Map{{U'9', U'g'}}));
    EXPECT_EQ(loaded.get_log_config().level, LogLevel::ERROR);
}

TEST_F(ConfigManagerTest, MissingFile) {
    EXPECT_THROW(manager.load_from_file("/nonexistent/dir/wordguard.json"), IOException);
}

TEST_F(ConfigManagerTest, UpdateParam) {
    manager.update_param("sanitize_leet_speak", "false");
    EXPECT_FALSE(manager.get_options().sanitize_leet_speak);

    manager.update_param("exact_word", "true");
    EXPECT_TRUE(manager.get_options().exact_word);
    EXPECT_FALSE(manager.get_options().sanitize_spaces);

    manager.update_param("sanitize_spaces", "on");
    EXPECT_TRUE(manager.get_options().sanitize_spaces);
    EXPECT_FALSE(manager.get_options().exact_word);

    manager.update_param("file_output", "0");
    EXPECT_FALSE(manager.get_log_config().file_output);

    EXPECT_THROW(manager.update_param("unknown", "true"), ConfigException);
    EXPECT_THROW(manager.update_param("sanitize_accents", "maybe"), ConfigException);
    EXPECT_THROW(manager.update_param("log_level", "VERBOSE"), ConfigException);
}

TEST_F(ConfigManagerTest, UpdateOptionsValidates) {
    DetectorOptions options;
    options.exact_word = true;
    EXPECT_THROW(manager.update_options(options), ConfigException);
    EXPECT_FALSE(manager.get_options().exact_word);
}

TEST_F(ConfigManagerTest, UpdateLogConfigValidates) {
    LogConfig config;
    config.file_output = true;
    config.log_file = "";
    EXPECT_THROW(manager.update_log_config(config), ConfigException);
    EXPECT_FALSE(manager.get_log_config().file_output);
}

TEST_F(ConfigManagerTest, ResetToDefaults) {
    manager.update_param("sanitize_accents", "false");
    manager.set_custom_replacements(ReplacementTable::defaults());
    manager.reset_to_defaults();

    EXPECT_EQ(manager.get_options(), DetectorOptions());
    EXPECT_FALSE(manager.get_config().use_custom_replacements);

    manager.set_custom_replacements(ReplacementTable::defaults());
    manager.clear_custom_replacements();
    EXPECT_FALSE(manager.get_config().use_custom_replacements);
}

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARNING);
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_THROW(parse_log_level("debug"), ConfigException);
}

TEST(LoggingTest, LevelControl) {
    Logger& logger = Logger::instance();
    LogLevel previous = logger.get_level();

    logger.set_level(LogLevel::ERROR);
    EXPECT_EQ(logger.get_level(), LogLevel::ERROR);
    EXPECT_EQ(logger.config().level, LogLevel::ERROR);

    logger.set_level(previous);
}

TEST(LoggingTest, WritesToFile) {
    auto log_dir = std::filesystem::temp_directory_path() / "wordguard_log_test";
    std::filesystem::remove_all(log_dir);

    LogConfig config;
    config.level = LogLevel::INFO;
    config.console_output = false;
    config.file_output = true;
    config.log_dir = log_dir.string();
    config.log_file = "test.log";

    Logger& logger = Logger::instance();
    logger.initialize(config);
    LOG_INFO("file logging works");
    LOG_DEBUG("filtered out");
    logger.initialize(LogConfig());

    std::ifstream file(log_dir / "test.log");
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("[INFO]"), std::string::npos);
    EXPECT_NE(content.find("file logging works"), std::string::npos);
    EXPECT_EQ(content.find("filtered out"), std::string::npos);

    std::filesystem::remove_all(log_dir);
}
