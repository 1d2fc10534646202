// EN: Unit tests for ConfigManager and the parser configuration loader
// FR: Tests unitaires du ConfigManager et du chargeur de configuration du parser

#include <gtest/gtest.h>
#include "csv/parse_config.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/ingest_error.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace CIP;

const std::string TEST_YAML = R"(
parser:
  delimiter: ";"
  newline: crlf
  quote_char: "'"
  comments: true
  skip_empty_lines: greedy
  delimiters_to_guess: [",", tab, pipe]
  chunk_size: 4096
  encoding: windows-1252
  max_field_size: 512

logging:
  level: debug
  file: ${CIP_TEST_LOG_DIR}/ingest.log

modules:
  - preview
  - streaming
)";

// EN: Test fixture resetting the singleton around each test
// FR: Fixture de test remettant le singleton à zéro autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("CIP_TEST_LOG_DIR");
        unsetenv("CIP_PARSER_CHUNK_SIZE");
        unsetenv("CIP_PARSER_DELIMITER");
        unsetenv("CIP_UNKNOWN_KEY");
    }
};

TEST_F(ConfigManagerTest, LoadsTypedValuesFromYaml) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_EQ(config.get("parser", "delimiter").as<std::string>(), ";");
    EXPECT_EQ(config.get("parser", "chunk_size").as<int>(), 4096);
    EXPECT_TRUE(config.get("parser", "comments").as<bool>());
    EXPECT_EQ(config.get("parser", "delimiters_to_guess").as<std::vector<std::string>>().size(), 3u);
    EXPECT_EQ(config.get("modules", "value").as<std::vector<std::string>>()[1], "streaming");
    EXPECT_FALSE(config.get("parser", "missing").isValid());
    EXPECT_THROW(config.get("parser", "chunk_size").as<std::string>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariables) {
    setenv("CIP_TEST_LOG_DIR", "/tmp/cip", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/tmp/cip/ingest.log");
}

TEST_F(ConfigManagerTest, RejectsMalformedYaml) {
    auto& config = ConfigManager::getInstance();
    EXPECT_FALSE(config.loadFromString("parser: [unterminated"));
    EXPECT_FALSE(config.loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(config.loadFromFile("/nonexistent/cip.yaml"));
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "cip_config_test.yaml";
    {
        std::ofstream out(path);
        out << TEST_YAML;
    }
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_TRUE(config.has("parser", "encoding"));
    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, AppliesEnvironmentOverridesToKnownSections) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    setenv("CIP_PARSER_CHUNK_SIZE", "65536", 1);
    setenv("CIP_UNKNOWN_KEY", "ignored", 1);

    EXPECT_EQ(config.loadEnvironmentOverrides(), 1u);
    EXPECT_EQ(config.get("parser", "chunk_size").as<int>(), 65536);
    EXPECT_FALSE(config.has("unknown", "key"));
}

TEST_F(ConfigManagerTest, ValidatesRules) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    config.addValidationRules({
        {"logging.level", "string", true, std::nullopt, std::nullopt, {"debug", "info", "warn", "error"}, "Log level"},
        {"parser.chunk_size", "int", true, 1.0, 1048576.0, {}, "Chunk size"},
        {"parser.max_row_size", "int", true, 1.0, std::nullopt, {}, "Largest row"}
    });

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("parser.max_row_size"), std::string::npos);

    config.set("parser", "max_row_size", 1024);
    config.set("logging", "level", "verbose");
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("not allowed"), std::string::npos);

    config.set("logging", "level", "info");
    config.set("parser", "chunk_size", 0);
    EXPECT_FALSE(config.validate(errors));
    EXPECT_NE(errors[0].find("below minimum"), std::string::npos);
}

TEST_F(ConfigManagerTest, DumpListsSectionsInOrder) {
    auto& config = ConfigManager::getInstance();
    config.set("parser", "encoding", "utf-8");
    config.set("logging", "level", "warn");

    std::string dump = config.dump();
    EXPECT_LT(dump.find("[logging]"), dump.find("[parser]"));
    EXPECT_NE(dump.find("encoding = utf-8"), std::string::npos);
    EXPECT_EQ(config.getSectionNames(), (std::vector<std::string>{"logging", "parser"}));
}

TEST_F(ConfigManagerTest, BuildsParseConfigFromParserSection) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    CSV::ParseConfig parse = CSV::loadParseConfig();
    EXPECT_EQ(parse.delimiter, ";");
    EXPECT_EQ(parse.newline, CSV::NewlineStyle::CRLF);
    EXPECT_EQ(parse.quote_char, '\'');
    EXPECT_EQ(parse.escape_char, '\'');   // EN: Follows quote_char by default / FR: Suit quote_char par défaut
    EXPECT_EQ(parse.comments, "#");
    EXPECT_EQ(parse.skip_empty_lines, CSV::EmptyLinePolicy::GREEDY);
    EXPECT_EQ(parse.delimiters_to_guess, (std::vector<std::string>{",", "\t", "|"}));
    EXPECT_EQ(parse.chunk_size, 4096u);
    EXPECT_EQ(parse.encoding, "windows-1252");
    EXPECT_EQ(parse.max_field_size, 512u);
    EXPECT_EQ(parse.max_row_size, 10485760u);
}

TEST_F(ConfigManagerTest, MissingParserSectionKeepsDefaults) {
    CSV::ParseConfig parse = CSV::loadParseConfig();
    EXPECT_TRUE(parse.delimiter.empty());
    EXPECT_EQ(parse.newline, CSV::NewlineStyle::AUTO);
    EXPECT_EQ(parse.chunk_size, CSV::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(parse.encoding, "utf-8");
}

TEST_F(ConfigManagerTest, RejectsInvalidParserValues) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
parser:
  newline: sometimes
  quote_char: "ab"
  chunk_size: -5
)"));

    try {
        CSV::loadParseConfig();
        FAIL() << "Expected IngestException";
    } catch (const IngestException& e) {
        EXPECT_EQ(e.code(), IngestError::INVALID_CONFIG);
        std::string message = e.what();
        EXPECT_NE(message.find("newline"), std::string::npos);
        EXPECT_NE(message.find("quote_char"), std::string::npos);
        EXPECT_NE(message.find("chunk_size"), std::string::npos);
    }
}

TEST_F(ConfigManagerTest, ValidateParseConfigCatchesConflicts) {
    CSV::ParseConfig parse;
    parse.delimiter = "\"";
    EXPECT_THROW(CSV::validateParseConfig(parse), IngestException);

    parse.delimiter = ",";
    parse.comments = ",";
    EXPECT_THROW(CSV::validateParseConfig(parse), IngestException);

    parse.comments = "#";
    EXPECT_NO_THROW(CSV::validateParseConfig(parse));
}
