/**
 * @file test_channel.cpp
 * @brief Unit tests for the multi-producer, single-consumer channel
 */

#include <gtest/gtest.h>
#include "fanout/channel.hpp"

#include <map>
#include <thread>
#include <vector>

namespace fanout {
namespace testing {

// Test items arrive in send order
TEST(ChannelTest, DeliversInOrder) {
    auto [tx, rx] = makeChannel<int>();
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(tx.send(i));
    }

    for (int i = 0; i < 5; ++i) {
        auto value = rx.tryRecv();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_FALSE(rx.tryRecv().has_value());
}

// Test the channel closes only after the last sender copy is gone
TEST(ChannelTest, ClosesWhenLastSenderDropped) {
    auto channel = makeChannel<int>();
    auto rx = std::move(channel.second);
    {
        auto tx = std::move(channel.first);
        auto copy = tx;
        copy.send(7);
        EXPECT_FALSE(rx.isClosed());
    }

    auto value = rx.recv();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);
    EXPECT_FALSE(rx.recv().has_value());
    EXPECT_TRUE(rx.isClosed());
}

// Test send reports failure once the receiver is destroyed
TEST(ChannelTest, SendFailsWithoutReceiver) {
    auto channel = makeChannel<int>();
    auto tx = std::move(channel.first);
    {
        auto rx = std::move(channel.second);
    }
    EXPECT_FALSE(tx.send(1));
}

// Test a moved-from sender does not keep the channel open
TEST(ChannelTest, MovedFromSenderIsInert) {
    auto channel = makeChannel<int>();
    auto rx = std::move(channel.second);
    auto tx = std::move(channel.first);
    auto other = std::move(tx);
    EXPECT_FALSE(tx.send(1));
    EXPECT_TRUE(other.send(2));
    {
        auto sink = std::move(other);
    }
    ASSERT_EQ(rx.recv().value_or(-1), 2);
    EXPECT_FALSE(rx.recv().has_value());
}

// Test concurrent producers: nothing lost, per-producer order kept
TEST(ChannelTest, ManyProducersKeepPerProducerOrder) {
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 500;

    auto channel = makeChannel<std::pair<int, int>>();
    auto rx = std::move(channel.second);
    std::vector<std::thread> producers;
    {
        auto tx = std::move(channel.first);
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([tx, p] {
                for (int i = 0; i < kPerProducer; ++i) {
                    tx.send({p, i});
                }
            });
        }
    }

    std::map<int, int> next;
    int received = 0;
    while (auto item = rx.recv()) {
        EXPECT_EQ(item->second, next[item->first]) << "producer " << item->first;
        next[item->first] = item->second + 1;
        ++received;
    }

    for (auto& t : producers) {
        t.join();
    }
    EXPECT_EQ(received, kProducers * kPerProducer);
}

}
}
