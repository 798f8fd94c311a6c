#include "event_queue.hpp"
#include "queue_reporter.hpp"
#include "rate_limiter.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <variant>

using namespace nsp_split;
using namespace std::chrono_literals;

TEST(EventQueueTest, TryPopOnEmptyReturnsNothing) {
    EventQueue queue;
    EXPECT_FALSE(queue.try_pop().has_value());
    EXPECT_TRUE(queue.pop_all().empty());
}

TEST(EventQueueTest, PreservesFifoOrder) {
    EventQueue queue;
    queue.push(StartPartEvent{0, 2});
    queue.push(FinishPartEvent{0, 2});
    queue.push(NormalExitEvent{});

    auto first = queue.try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<StartPartEvent>(*first));

    const auto rest = queue.pop_all();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<FinishPartEvent>(rest[0]));
    EXPECT_TRUE(is_terminal(rest[1]));
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(EventQueueTest, ConcurrentProducerKeepsOrder) {
    EventQueue queue;
    constexpr std::uint64_t kCount = 20000;

    std::thread producer([&] {
        for (std::uint64_t i = 0; i < kCount; ++i) {
            queue.push(FileProgressEvent{i, kCount});
        }
        queue.push(NormalExitEvent{});
    });

    std::uint64_t expected = 0;
    bool done = false;
    while (!done) {
        while (auto event = queue.try_pop()) {
            if (is_terminal(*event)) {
                done = true;
                break;
            }
            const auto& progress = std::get<FileProgressEvent>(*event);
            EXPECT_EQ(progress.written_bytes, expected);
            ++expected;
        }
    }
    producer.join();
    EXPECT_EQ(expected, kCount);
}

TEST(RateLimiterTest, FirstCallWaitsForInterval) {
    test::FakeClock clock;
    RateLimiter limiter(100ms, clock.source());

    EXPECT_FALSE(limiter.allow());
    clock.now += 99ms;
    EXPECT_FALSE(limiter.allow());
    clock.now += 1ms;
    EXPECT_TRUE(limiter.allow());
    EXPECT_FALSE(limiter.allow());
    clock.now += 100ms;
    EXPECT_TRUE(limiter.allow());
}

TEST(QueueReporterTest, BurstOfProgressForwardsAtMostOne) {
    EventQueue queue;
    test::FakeClock clock;
    QueueReporter reporter(queue, clock.source());

    // 1000 chunk reports spread across 10 ms.
    for (int i = 0; i < 1000; ++i) {
        reporter.report_file_progress(static_cast<std::uint64_t>(i) * 0x8000, 1000ull * 0x8000);
        if (i % 100 == 99) {
            clock.now += 1ms;
        }
    }

    std::size_t forwarded = 0;
    for (const auto& event : queue.pop_all()) {
        if (std::holds_alternative<FileProgressEvent>(event)) {
            ++forwarded;
        }
    }
    EXPECT_LE(forwarded, 1u);
}

TEST(QueueReporterTest, ForwardsProgressOncePerInterval) {
    EventQueue queue;
    test::FakeClock clock;
    QueueReporter reporter(queue, clock.source());

    clock.now += 130ms;
    reporter.report_file_progress(10, 100);
    clock.now += 129ms;
    reporter.report_file_progress(20, 100);
    clock.now += 1ms;
    reporter.report_file_progress(30, 100);

    const auto events = queue.pop_all();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<FileProgressEvent>(events[0]).written_bytes, 10u);
    EXPECT_EQ(std::get<FileProgressEvent>(events[1]).written_bytes, 30u);
}

TEST(QueueReporterTest, BoundaryEventsAreNeverDropped) {
    EventQueue queue;
    test::FakeClock clock;
    QueueReporter reporter(queue, clock.source());

    reporter.report_initial_info(2, 2000);
    reporter.report_start_part(0, 2);
    reporter.report_file_progress(1000, 2000);
    reporter.report_finish_part(0, 2);
    reporter.report_start_part(1, 2);
    reporter.report_file_progress(2000, 2000);
    reporter.report_finish_part(1, 2);
    reporter.report_archive_bit(std::string("no xattr"));

    const auto events = queue.pop_all();
    ASSERT_EQ(events.size(), 6u);
    const auto& info = std::get<InitialInfoEvent>(events[0]);
    EXPECT_EQ(info.total_parts, 2u);
    EXPECT_EQ(info.total_bytes, 2000u);
    EXPECT_EQ(std::get<StartPartEvent>(events[1]).part_number, 0u);
    EXPECT_EQ(std::get<FinishPartEvent>(events[2]).part_number, 0u);
    EXPECT_EQ(std::get<StartPartEvent>(events[3]).part_number, 1u);
    EXPECT_EQ(std::get<FinishPartEvent>(events[4]).part_number, 1u);
    const auto& archive = std::get<ArchiveBitEvent>(events[5]);
    ASSERT_TRUE(archive.error_message.has_value());
    EXPECT_EQ(*archive.error_message, "no xattr");
}
