// STAKEFLOW - Util Module Tests
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeflow/util/logging.h>
#include <stakeflow/util/time.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeflow {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
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
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, StreamMacroCapturesMessage) {
    LOG_INFO(LogCategory::STAKING) << "staked " << 990 << " units";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "staking");
    EXPECT_EQ(entries_[0].message, "staked 990 units");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_util.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::FEES) << "hidden";
    LOG_INFO(LogCategory::FEES) << "hidden";
    LOG_WARN(LogCategory::FEES) << "shown";
    LOG_ERROR(LogCategory::FEES) << "shown";

    EXPECT_EQ(entries_.size(), 2u);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::FEES));
}

TEST_F(LoggingTest, FilteredStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluations = 0;
    auto expensive = [&]() { ++evaluations; return 1; };
    LOG_DEBUG(LogCategory::STAKING) << expensive();
    EXPECT_EQ(evaluations, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::CONTROLLER);
    LOG_INFO(LogCategory::CONTROLLER) << "rate";
    LOG_INFO(LogCategory::VAULT) << "transfer";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "controller");
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::CONTROLLER));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::VAULT));
}

TEST_F(LoggingTest, SinkLevelFiltering) {
    sink_->SetLevel(LogLevel::Error);
    LOG_INFO(LogCategory::DEFAULT) << "dropped by sink";
    LOG_ERROR(LogCategory::DEFAULT) << "kept";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST_F(LoggingTest, AddRemoveSinks) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    auto second = std::make_shared<CallbackSink>([](const LogEntry&) {});
    Logger::Instance().AddSink(second);
    EXPECT_EQ(Logger::Instance().SinkCount(), 2u);
    Logger::Instance().RemoveSink(second);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, FileSinkWritesFormattedLine) {
    std::string path = ::testing::TempDir() + "stakeflow_log_test.log";
    std::remove(path.c_str());
    {
        auto file = std::make_shared<FileSink>(path);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_WARN(LogCategory::VAULT) << "transfer rejected";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(file);
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[WARN] [vault]"), std::string::npos);
    EXPECT_NE(line.find("transfer rejected"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LogFormatTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c:\\src\\d.cpp"), "d.cpp");
    EXPECT_EQ(GetBasename("plain.cpp"), "plain.cpp");
}

// ============================================================================
// Time Tests
// ============================================================================

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
        SetMockTime(0);
    }
};

TEST_F(MockTimeTest, RealTimeIsRecent) {
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1700000000);
}

TEST_F(MockTimeTest, SetAndAdvance) {
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_EQ(GetTime(), 1000);
    AdvanceMockTime(Seconds(86400));
    EXPECT_EQ(GetTime(), 87400);
    DisableMockTime();
    EXPECT_NE(GetTime(), 87400);
}

TEST_F(MockTimeTest, ScopedMockTimeRestores) {
    {
        ScopedMockTime clock(5000);
        EXPECT_TRUE(IsMockTimeEnabled());
        EXPECT_EQ(GetTime(), 5000);
        clock.Advance(Seconds(60));
        EXPECT_EQ(clock.Now(), 5060);
        clock.Set(42);
        EXPECT_EQ(GetTime(), 42);
    }
    EXPECT_FALSE(IsMockTimeEnabled());
}

TEST(TimeFormatTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
}

TEST(TimeFormatTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds(0)), "0s");
    EXPECT_EQ(FormatDuration(Seconds(59)), "59s");
    EXPECT_EQ(FormatDuration(Seconds(7 * 86400)), "7d");
    EXPECT_EQ(FormatDuration(Seconds(86400 + 2 * 3600 + 3 * 60 + 4)), "1d 2h 3m 4s");
    EXPECT_EQ(FormatDuration(Seconds(-90)), "-1m 30s");
}

TEST(TimeFormatTest, ParseDuration) {
    EXPECT_EQ(ParseDuration("90").count(), 90);
    EXPECT_EQ(ParseDuration("30s").count(), 30);
    EXPECT_EQ(ParseDuration("15m").count(), 900);
    EXPECT_EQ(ParseDuration("12h").count(), 43200);
    EXPECT_EQ(ParseDuration("7d").count(), 604800);

    EXPECT_THROW(ParseDuration(""), std::invalid_argument);
    EXPECT_THROW(ParseDuration("d"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("5w"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("5dd"), std::invalid_argument);
    EXPECT_THROW(ParseDuration("-5s"), std::invalid_argument);
}

} // namespace
} // namespace util
} // namespace stakeflow
