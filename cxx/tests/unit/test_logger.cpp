#include <gtest/gtest.h>
#include "Logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace blabber;

TEST(LoggerTest, SingleThreadedPushPop) {
    auto& logger = EventLogger::instance();
    
    // Clear any existing entries
    while (logger.pop_entry()) {}

    logger.log_message("TEST", "Hello World");
    logger.log_event("VALUE", 42.0f);

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");
    EXPECT_GT(entry1->timestamp, 0u);

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "VALUE");
    EXPECT_EQ(entry2->value, 42.0f);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongMessagesAreTruncated) {
    auto& logger = EventLogger::instance();
    while (logger.pop_entry()) {}

    std::string long_message(200, 'x');
    logger.log_message("TRUNC", long_message.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->message).size(), sizeof(entry->message) - 1);
}

TEST(LoggerTest, FormattedMessage) {
    auto& logger = EventLogger::instance();
    while (logger.pop_entry()) {}

    log_messagef("Connect", "guild %llu -> %s", 7ULL, "General");

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_STREQ(entry->message, "guild 7 -> General");
}

TEST(LoggerTest, FlushDrainsToStream) {
    auto& logger = EventLogger::instance();
    while (logger.pop_entry()) {}

    logger.log_message("A", "first");
    logger.log_event("B", 2.0f);

    std::ostringstream out;
    EXPECT_EQ(logger.flush(out), 2u);
    EXPECT_NE(out.str().find("[A] first"), std::string::npos);
    EXPECT_NE(out.str().find("[B] 2"), std::string::npos);
    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, MultiProducerCapture) {
    auto& logger = EventLogger::instance();
    while (logger.pop_entry()) {}
    uint64_t dropped_before = logger.dropped();

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // Background consumer
    std::thread consumer([&]() {
        while (running) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else {
                std::this_thread::yield();
            }
        }
        while (auto entry = logger.pop_entry()) {
            captured.push_back(*entry);
        }
    });

    // Command threads
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&logger]() {
            for (int i = 0; i < 100; ++i) {
                logger.log_event("ITER", static_cast<float>(i));
            }
        });
    }

    for (auto& t : producers) t.join();
    running = false;
    consumer.join();

    EXPECT_EQ(captured.size() + (logger.dropped() - dropped_before), 400u);
    for (const auto& entry : captured) {
        EXPECT_STREQ(entry.tag, "ITER");
    }
}

TEST(LoggerTest, DrainKeepsUpWithProducers) {
    auto& logger = EventLogger::instance();
    while (logger.pop_entry()) {}
    uint64_t dropped_before = logger.dropped();

    std::ostringstream out;
    {
        EventLogDrain drain(out, std::chrono::milliseconds(2));

        // Three batches that together overflow the ring several times.
        for (int batch = 0; batch < 3; ++batch) {
            for (int i = 0; i < 800; ++i) {
                logger.log_event("BATCH", static_cast<float>(batch));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        drain.stop();
    }

    EXPECT_EQ(logger.dropped(), dropped_before);
    std::string text = out.str();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2400);
    EXPECT_FALSE(logger.pop_entry().has_value());
}
