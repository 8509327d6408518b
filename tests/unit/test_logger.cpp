#include <gtest/gtest.h>
#include "utils/cpp_logger.h"

#include <chrono>
#include <thread>

using namespace sendspin::audio::logging;

TEST(LoggerTest, FormatsAndQueuesMessages) {
    auto logger = std::make_shared<Logger>(LogLevel::DEBUG);
    LOG_CPP_INFO(logger, "[Test] value=%d name=%s", 42, "kitchen");

    auto entries = logger->retrieve_log_entries(0);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[0].message, "[Test] value=42 name=kitchen");
    EXPECT_EQ(entries[0].filename, "test_logger.cpp");
    EXPECT_GT(entries[0].line_number, 0);
}

TEST(LoggerTest, FiltersBelowLevel) {
    auto logger = std::make_shared<Logger>(LogLevel::WARNING);
    LOG_CPP_DEBUG(logger, "hidden");
    LOG_CPP_INFO(logger, "hidden");
    LOG_CPP_WARNING(logger, "shown");
    LOG_CPP_ERROR(logger, "shown");
    EXPECT_EQ(logger->pending(), 2u);

    logger->set_level(LogLevel::DEBUG);
    LOG_CPP_DEBUG(logger, "now shown");
    EXPECT_EQ(logger->pending(), 3u);
}

TEST(LoggerTest, NullLoggerIsSilent) {
    LoggerPtr logger;
    LOG_CPP_ERROR(logger, "nobody listens %d", 1);
    SUCCEED();
}

TEST(LoggerTest, LongMessagesAreNotTruncated) {
    auto logger = std::make_shared<Logger>();
    const std::string long_text(3000, 'x');
    LOG_CPP_INFO(logger, "%s", long_text.c_str());
    auto entries = logger->retrieve_log_entries(0);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.size(), 3000u);
}

TEST(LoggerTest, RetrievesInBatches) {
    auto logger = std::make_shared<Logger>();
    for (int i = 0; i < 150; ++i) {
        LOG_CPP_INFO(logger, "message %d", i);
    }
    EXPECT_EQ(logger->retrieve_log_entries(0).size(), Logger::kMaxBatchSize);
    auto rest = logger->retrieve_log_entries(0);
    ASSERT_EQ(rest.size(), 50u);
    EXPECT_EQ(rest.back().message, "message 149");
}

TEST(LoggerTest, OverflowDropsOldestAndWarnsOnce) {
    auto logger = std::make_shared<Logger>();
    for (size_t i = 0; i < Logger::kMaxQueueSize + 10; ++i) {
        LOG_CPP_INFO(logger, "message %zu", i);
    }
    EXPECT_LE(logger->pending(), Logger::kMaxQueueSize + 1);

    auto first = logger->retrieve_log_entries(0);
    ASSERT_FALSE(first.empty());
    EXPECT_NE(first.front().message, "message 0");

    size_t overflow_warnings = 0;
    std::vector<LogEntry> all = first;
    for (auto batch = logger->retrieve_log_entries(0); !batch.empty(); batch = logger->retrieve_log_entries(0)) {
        all.insert(all.end(), batch.begin(), batch.end());
    }
    for (const auto& entry : all) {
        if (entry.message.find("overflow") != std::string::npos) {
            ++overflow_warnings;
        }
    }
    EXPECT_EQ(overflow_warnings, 1u);
    EXPECT_EQ(all.back().message, "message " + std::to_string(Logger::kMaxQueueSize + 9));
}

TEST(LoggerTest, ShutdownWakesRetrieverAndDropsNewMessages) {
    auto logger = std::make_shared<Logger>();
    std::thread consumer([&]() {
        auto entries = logger->retrieve_log_entries(5000);
        EXPECT_TRUE(entries.empty());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const auto started = std::chrono::steady_clock::now();
    logger->shutdown();
    consumer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    LOG_CPP_ERROR(logger, "after shutdown");
    EXPECT_EQ(logger->pending(), 0u);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(level_name(LogLevel::ERR), "ERROR");
    EXPECT_STREQ(get_base_filename("/a/b/c.cpp"), "c.cpp");
    EXPECT_STREQ(get_base_filename("plain.h"), "plain.h");
}
