#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace pitchscribe::utils;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(tempPath.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream out(tempPath);
        out << content;
    }

    std::string tempPath = "pitchscribe_config_test.json";
};

TEST_F(ConfigTest, Defaults) {
    auto config = Config::defaults();

    EXPECT_EQ(config.getPort(), 8080);
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.provider().baseUrl, "https://api.gladia.io");
    EXPECT_EQ(config.streaming().chunkBytes, 4096u);
    EXPECT_EQ(config.streaming().maxConsecutiveTimeouts, 10u);
    EXPECT_EQ(config.batch().maxPollAttempts, 30u);
    EXPECT_EQ(config.batch().maxUploadBytes, 10u * 1024 * 1024);
    EXPECT_DOUBLE_EQ(config.intelligence().targetWpm, 150.0);
    EXPECT_TRUE(config.scoring().endpoint.empty());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, FromJsonOverridesSections) {
    auto config = Config::fromJson({
        {"server", {{"port", 9090}}},
        {"logging", {{"level", "DEBUG"}}},
        {"provider", {{"base_url", "http://localhost:9000"}, {"api_key", "secret"}}},
        {"streaming", {{"read_timeout_ms", 500}, {"chunk_interval_ms", 0}}},
        {"batch", {{"max_poll_attempts", 5}, {"delete_job_after_completion", false}}},
        {"intelligence", {{"target_wpm", 140.0}}},
        {"scoring", {{"endpoint", "http://scoring/api"}}}
    });

    EXPECT_EQ(config.getPort(), 9090);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.provider().apiKey, "secret");
    EXPECT_EQ(config.streaming().readTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(config.streaming().chunkInterval, std::chrono::milliseconds(0));
    EXPECT_EQ(config.streaming().chunkBytes, 4096u);
    EXPECT_EQ(config.batch().maxPollAttempts, 5u);
    EXPECT_FALSE(config.batch().deleteJobAfterCompletion);
    EXPECT_DOUBLE_EQ(config.intelligence().targetWpm, 140.0);
    EXPECT_EQ(config.scoring().endpoint, "http://scoring/api");
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"server", {{"port", 70000}}}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"server", {{"port", "http"}}}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"streaming", {{"max_messages", 0}}}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"streaming", {{"read_timeout_ms", 0}}}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"batch", "fast"}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"provider", {{"base_url", ""}}}}), ConfigurationException);
    EXPECT_THROW(Config::fromJson({{"intelligence", {{"target_wpm", -1.0}}}}), ConfigurationException);
}

TEST_F(ConfigTest, ToJsonRoundTripWithoutSecrets) {
    auto config = Config::fromJson({{"provider", {{"api_key", "secret"}}}, {"server", {{"port", 7000}}}});
    auto j = config.toJson();

    EXPECT_FALSE(j.at("provider").contains("api_key"));
    auto restored = Config::fromJson(j);
    EXPECT_EQ(restored.getPort(), 7000);
    EXPECT_EQ(restored.toJson(), j);
}

TEST_F(ConfigTest, LoadFromFile) {
    writeFile(R"({"server": {"port": 8181}, "batch": {"poll_interval_ms": 250}})");
    auto config = Config::load(tempPath);
    EXPECT_EQ(config.getPort(), 8181);
    EXPECT_EQ(config.batch().pollInterval, std::chrono::milliseconds(250));
}

TEST_F(ConfigTest, LoadMissingFileUsesDefaults) {
    auto config = Config::load("does/not/exist.json");
    EXPECT_EQ(config.getPort(), 8080);
}

TEST_F(ConfigTest, LoadMalformedFileThrows) {
    writeFile("{ \"server\": ");
    EXPECT_THROW(Config::load(tempPath), ConfigurationException);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::INFO);

    auto previous = Logger::getLevel();
    Logger::setLevel(LogLevel::WARN);
    EXPECT_EQ(Logger::getLevel(), LogLevel::WARN);
    Logger::setLevel(previous);
}
