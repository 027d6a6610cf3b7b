// NOCKLEDGER - Logging Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/util/logging.h"

#include <memory>
#include <string>
#include <vector>

namespace nockledger {
namespace util {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);

    auto console = std::make_shared<ConsoleSink>();
    logger.AddSink(console);
    EXPECT_EQ(logger.SinkCount(), 2u);

    logger.RemoveSink(console);
    EXPECT_EQ(logger.SinkCount(), 1u);
}

TEST_F(LoggingTest, LevelFiltering) {
    auto& logger = Logger::Instance();
    logger.Log(LogLevel::Debug, LogCategory::WALLET, "hidden");
    logger.Log(LogLevel::Warn, LogCategory::WALLET, "shown");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, LogCategory::WALLET);

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::DEFAULT));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    std::vector<std::string> errors;
    auto errorSink = std::make_shared<CallbackSink>(
        [&errors](const LogEntry& entry) { errors.push_back(entry.message); },
        LogLevel::Error);
    Logger::Instance().AddSink(errorSink);

    Logger::Instance().Log(LogLevel::Info, LogCategory::DEFAULT, "info");
    Logger::Instance().Log(LogLevel::Error, LogCategory::DEFAULT, "error");

    EXPECT_EQ(entries_.size(), 2u);
    EXPECT_EQ(errors, (std::vector<std::string>{"error"}));
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::LEDGER);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::MINING));

    logger.Log(LogLevel::Info, LogCategory::MINING, "dropped");
    logger.Log(LogLevel::Info, LogCategory::LEDGER, "kept");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");

    logger.DisableCategory(LogCategory::LEDGER);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::MINING));
}

TEST_F(LoggingTest, StreamMacro) {
    LOG_INFO(LogCategory::WALLET) << "sent " << 42 << " to " << "peer";
    LOG_DEBUG(LogCategory::WALLET) << "not emitted";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "sent 42 to peer");
    EXPECT_GT(entries_[0].line, 0);
    EXPECT_FALSE(entries_[0].file.empty());
}

TEST_F(LoggingTest, FormatMacro) {
    LogWarnF(LogCategory::STORAGE, "record %s is %d bytes", "notes", 17);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "record notes is 17 bytes");
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, ScopedLogTimerLogsAtDebug) {
    {
        ScopedLogTimer timer(LogCategory::MINING, "quiet");
    }
    EXPECT_TRUE(entries_.empty());

    Logger::Instance().SetLevel(LogLevel::Debug);
    {
        ScopedLogTimer timer(LogCategory::MINING, "mine");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("mine took ", 0), 0u);
}

} // namespace
} // namespace util
} // namespace nockledger
