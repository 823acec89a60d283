// EN: Unit tests for Logger - NDJSON formatting, level filtering and file output
// FR: Tests unitaires pour Logger - formatage NDJSON, filtrage par niveau et sortie fichier

#include <gtest/gtest.h>

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace MDC;

namespace {

std::vector<nlohmann::json> readLines(const std::string& path) {
    std::vector<nlohmann::json> lines;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = (std::filesystem::temp_directory_path() / "mdcache_logger_test.ndjson").string();
        std::filesystem::remove(log_path_);

        auto& logger = Logger::getInstance();
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        ASSERT_TRUE(logger.setOutputFile(log_path_));
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.resetOutput();
        logger.clearGlobalMetadata();
        logger.setLogLevel(LogLevel::ERROR);
        std::filesystem::remove(log_path_);
    }

    std::string log_path_;
};

// EN: Messages below the current level are dropped
// FR: Les messages sous le niveau courant sont ignorés
TEST_F(LoggerTest, LogLevel_ShouldFilterMessages) {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::WARN);

    LOG_DEBUG("cache", "debug line");
    LOG_INFO("cache", "info line");
    LOG_WARN("cache", "warn line");
    LOG_ERROR("cache", "error line");
    logger.flush();

    const auto lines = readLines(log_path_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"], "WARN");
    EXPECT_EQ(lines[1]["message"], "error line");
    EXPECT_EQ(lines[1]["module"], "cache");
}

TEST_F(LoggerTest, Metadata_ShouldMergeWithGlobalMetadata) {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::DEBUG);
    logger.addGlobalMetadata("service", "mdcache");
    logger.addGlobalMetadata("key", "global-value");
    logger.setCorrelationId("req-42");

    LOG_INFO_META("wrapper", "stored", (std::unordered_map<std::string, std::string>{{"key", "global:v1:meta:tt1"}, {"ttl", "3600"}}));
    logger.flush();

    const auto lines = readLines(log_path_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["service"], "mdcache");
    EXPECT_EQ(lines[0]["key"], "global:v1:meta:tt1");
    EXPECT_EQ(lines[0]["ttl"], "3600");
    EXPECT_EQ(lines[0]["correlation_id"], "req-42");
}

// EN: Quotes, newlines and control characters produce valid single-line JSON
// FR: Guillemets, retours à la ligne et caractères de contrôle donnent un JSON valide sur une ligne
TEST(LoggerFormatTest, FormatAsNDJSON_ShouldEscapeSpecialCharacters) {
    Logger::LogEntry entry;
    entry.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    entry.level = LogLevel::ERROR;
    entry.message = "upstream said \"no\"\nline two\t\x01";
    entry.module = "wrapper";
    entry.thread_id = "1";
    entry.metadata = {{"level", "spoofed"}, {"path", "C:\\cache"}};

    const std::string line = Logger::formatAsNDJSON(entry);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    const auto parsed = nlohmann::json::parse(line);
    EXPECT_EQ(parsed["message"], entry.message);
    EXPECT_EQ(parsed["level"], "ERROR");
    EXPECT_EQ(parsed["path"], "C:\\cache");
    EXPECT_EQ(parsed["timestamp"], "2023-11-14T22:13:20.123Z");
    EXPECT_FALSE(parsed.contains("correlation_id"));
}

TEST(LoggerFormatTest, ParseLogLevel_ShouldAcceptNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
}

TEST(LoggerFormatTest, GenerateCorrelationId_ShouldLookLikeUuid) {
    const std::string id = Logger::getInstance().generateCorrelationId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_NE(id, Logger::getInstance().generateCorrelationId());
}
