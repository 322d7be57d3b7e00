#include <marshal-cpp/logger.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace marshal_cpp;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        saved_level_ = logger.level();
        logger.clear_sinks();
        logger.add_sink([this](const Logger::LogEntry& entry) { entries_.push_back(entry); });
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(saved_level_);
    }

    LogLevel saved_level_{LogLevel::warning};
    std::vector<Logger::LogEntry> entries_;
};

}  // anonymous namespace

TEST(LogLevel, names) {
    EXPECT_EQ(to_string_view(LogLevel::trace), "TRACE");
    EXPECT_EQ(to_string_view(LogLevel::warning), "WARN");
    EXPECT_EQ(to_string_view(LogLevel::critical), "CRITICAL");
}

TEST_F(LoggerTest, entries_below_the_level_are_dropped) {
    Logger::instance().set_level(LogLevel::warning);
    MARSHAL_CPP_LOG_DEBUG("test", "hidden");
    MARSHAL_CPP_LOG_WARN("test", "shown");
    MARSHAL_CPP_LOG_ERROR("test", "also shown");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_EQ(entries_[0].level, LogLevel::warning);
    EXPECT_EQ(entries_[1].level, LogLevel::error);
}

TEST_F(LoggerTest, placeholders_are_filled_in_order) {
    Logger::instance().set_level(LogLevel::trace);
    MARSHAL_CPP_LOG_INFO("codec", "{} of {} ({})", 3, std::string{"five"}, true);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "codec");
    EXPECT_EQ(entries_[0].message, "3 of five (true)");
}

TEST_F(LoggerTest, extra_placeholders_are_left_alone) {
    Logger::instance().set_level(LogLevel::trace);
    MARSHAL_CPP_LOG_INFO("codec", "{} {}", "one");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "one {}");
}

TEST_F(LoggerTest, disabled_without_sinks) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::trace);
    EXPECT_TRUE(logger.is_enabled(LogLevel::trace));
    logger.clear_sinks();
    EXPECT_FALSE(logger.is_enabled(LogLevel::critical));
}

TEST_F(LoggerTest, null_sink_accepts_entries) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::info);
    logger.add_sink(sinks::null_sink());
    logger.log(LogLevel::info, "test", "message");
    EXPECT_EQ(entries_.size(), 1u);
}

TEST(LoggerTimestamp, date_time_with_milliseconds) {
    auto tp = std::chrono::system_clock::time_point{} + std::chrono::hours{24 * 400} +
              std::chrono::milliseconds{42};
    auto text = Logger::timestamp_to_string(tp);
    ASSERT_EQ(text.size(), 23u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[19], '.');
    EXPECT_EQ(text.substr(20), "042");
}
