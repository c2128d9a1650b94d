#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "util/bounded_channel.hpp"

using repcat::bounded_channel;

TEST(BoundedChannel, FifoOrderAcrossThreads) {
    bounded_channel<int> ch(2);
    std::thread producer([&] {
        for (int i = 0; i < 1000; ++i) ASSERT_TRUE(ch.push(i));
        ch.close();
    });

    std::vector<int> got;
    while (auto v = ch.pop()) got.push_back(*v);
    producer.join();

    ASSERT_EQ(got.size(), 1000u);
    for (int i = 0; i < 1000; ++i) EXPECT_EQ(got[static_cast<size_t>(i)], i);
}

TEST(BoundedChannel, CloseDrainsThenEnds) {
    bounded_channel<int> ch(2);
    ASSERT_TRUE(ch.push(1));
    ASSERT_TRUE(ch.push(2));
    ch.close();
    EXPECT_FALSE(ch.push(3));
    EXPECT_EQ(ch.pop(), 1);
    EXPECT_EQ(ch.pop(), 2);
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(BoundedChannel, CloseWakesBlockedProducer) {
    bounded_channel<int> ch(1);
    ASSERT_TRUE(ch.push(0));
    bool pushed = true;
    std::thread producer([&] { pushed = ch.push(1); });
    ch.close();
    producer.join();
    EXPECT_FALSE(pushed);
}
