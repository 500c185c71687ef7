// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires pour le Logger NDJSON

#include <gtest/gtest.h>
#include "../include/infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace GCS;

// EN: Test fixture redirecting the singleton logger to a temporary file
// FR: Fixture de test redirigeant le logger singleton vers un fichier temporaire
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() /
                    ("gstream_logger_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                     "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ndjson");
        std::filesystem::remove(log_path_);

        logger_ = &Logger::getInstance();
        logger_->setLogLevel(LogLevel::DEBUG);
        logger_->setCorrelationId("");
        logger_->clearGlobalMetadata();
        ASSERT_TRUE(logger_->setOutputFile(log_path_.string()));
    }

    void TearDown() override {
        logger_->closeOutputFile();
        logger_->clearGlobalMetadata();
        logger_->setCorrelationId("");
        logger_->setLogLevel(LogLevel::INFO);
        std::filesystem::remove(log_path_);
    }

    std::vector<nlohmann::json> readRecords() {
        logger_->flush();
        std::vector<nlohmann::json> records;
        std::ifstream in(log_path_);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                records.push_back(nlohmann::json::parse(line));
            }
        }
        return records;
    }

    std::filesystem::path log_path_;
    Logger* logger_ = nullptr;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("file_analyzer", "Analysis started");
    LOG_WARN("memory_manager", "Usage above warning threshold");

    auto records = readRecords();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["level"], "INFO");
    EXPECT_EQ(records[0]["module"], "file_analyzer");
    EXPECT_EQ(records[0]["message"], "Analysis started");
    EXPECT_TRUE(records[0].contains("timestamp"));
    EXPECT_TRUE(records[0].contains("thread_id"));
    EXPECT_EQ(records[1]["level"], "WARN");
}

TEST_F(LoggerTest, FiltersBelowCurrentLevel) {
    logger_->setLogLevel(LogLevel::WARN);

    LOG_DEBUG("chunk_processor", "hidden");
    LOG_INFO("chunk_processor", "hidden");
    LOG_WARN("chunk_processor", "shown");
    LOG_ERROR("chunk_processor", "shown");

    auto records = readRecords();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["level"], "WARN");
    EXPECT_EQ(records[1]["level"], "ERROR");
}

// EN: Entry metadata is flattened and wins over global metadata
// FR: Les métadonnées de l'entrée sont aplaties et priment sur les globales
TEST_F(LoggerTest, MergesMetadataWithEntryPriority) {
    logger_->addGlobalMetadata("run", "global");
    logger_->addGlobalMetadata("host", "cnc-01");

    LOG_INFO_META("checkpoint_manager", "Checkpoint created",
                  (std::unordered_map<std::string, std::string>{{"run", "entry"}, {"checkpoint_id", "cp_1"}}));

    auto records = readRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["run"], "entry");
    EXPECT_EQ(records[0]["host"], "cnc-01");
    EXPECT_EQ(records[0]["checkpoint_id"], "cp_1");
}

TEST_F(LoggerTest, EscapesMessagesAndKeepsFixedFields) {
    LOG_ERROR_META("streamer", "line \"G1 X10\"\nfailed",
                   (std::unordered_map<std::string, std::string>{{"level", "spoofed"}}));

    auto records = readRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["message"], "line \"G1 X10\"\nfailed");
    EXPECT_EQ(records[0]["level"], "ERROR");
}

TEST_F(LoggerTest, CorrelationIdIsAttached) {
    const std::string id = logger_->generateCorrelationId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(std::count(id.begin(), id.end(), '-'), 4);

    logger_->setCorrelationId(id);
    LOG_INFO("streamer", "Starting stream");

    auto records = readRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["correlation_id"], id);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug").value_or(LogLevel::INFO), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO").value_or(LogLevel::INFO), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("Warning").value_or(LogLevel::INFO), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error").value_or(LogLevel::INFO), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_DEBUG("threadpool", "worker " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto records = readRecords();
    EXPECT_EQ(records.size(), 200u);
}
