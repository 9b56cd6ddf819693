#include "sample_mailbox.hpp"
#include "orientation_types.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace TiltStabilizer;

TEST(SampleMailbox, EmptyMailboxHasNothingNew) {
    SampleMailbox<int> mailbox;
    uint32_t last_seen = 0;
    int value = -1;

    EXPECT_EQ(mailbox.sequence(), 0u);
    EXPECT_FALSE(mailbox.hasNew(last_seen));
    EXPECT_FALSE(mailbox.tryReadNew(value, last_seen));
    EXPECT_EQ(value, -1);
}

TEST(SampleMailbox, EachValueIsReadOnce) {
    SampleMailbox<int> mailbox;
    uint32_t last_seen = 0;
    int value = 0;

    mailbox.publish(7);
    EXPECT_TRUE(mailbox.hasNew(last_seen));
    ASSERT_TRUE(mailbox.tryReadNew(value, last_seen));
    EXPECT_EQ(value, 7);
    EXPECT_EQ(last_seen, 1u);
    EXPECT_FALSE(mailbox.tryReadNew(value, last_seen));
}

TEST(SampleMailbox, OnlyLatestValueSurvives) {
    SampleMailbox<GravitySample> mailbox;
    mailbox.publish(GravitySample{1.0, 0.0, 0.0, 0.1});
    mailbox.publish(GravitySample{0.0, -1.0, 0.0, 0.2});

    uint32_t last_seen = 0;
    GravitySample sample;
    ASSERT_TRUE(mailbox.tryReadNew(sample, last_seen));
    EXPECT_EQ(sample.timestamp, 0.2);
    EXPECT_EQ(last_seen, 2u);
    EXPECT_EQ(mailbox.readLatest().y, -1.0);
}

TEST(SampleMailbox, ReadersTrackTheirOwnSequence) {
    SampleMailbox<int> mailbox;
    mailbox.publish(3);

    uint32_t reader_a = 0;
    uint32_t reader_b = 0;
    int a = 0;
    int b = 0;
    EXPECT_TRUE(mailbox.tryReadNew(a, reader_a));
    EXPECT_TRUE(mailbox.tryReadNew(b, reader_b));
    EXPECT_EQ(a, 3);
    EXPECT_EQ(b, 3);
}

TEST(SampleMailbox, ConsumerSeesIncreasingValues) {
    SampleMailbox<int> mailbox;
    const int count = 10000;

    std::thread producer([&]() {
        for (int i = 1; i <= count; ++i) {
            mailbox.publish(i);
        }
    });

    uint32_t last_seen = 0;
    int previous = 0;
    bool monotonic = true;
    while (previous < count) {
        int value = 0;
        if (mailbox.tryReadNew(value, last_seen)) {
            if (value <= previous) {
                monotonic = false;
            }
            previous = value;
        }
    }
    producer.join();

    EXPECT_TRUE(monotonic);
    EXPECT_EQ(mailbox.sequence(), static_cast<uint32_t>(count));
}
