#include "hostwatch/agent/delivery_queue.hpp"

#include <gtest/gtest.h>

namespace hostwatch::agent::test {

namespace {
Frame frame(uint8_t tag) {
    return Frame{tag, tag, tag};
}
}  // namespace

TEST(DeliveryQueueTest, StartsEmpty) {
    DeliveryQueue queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.capacity(), 0u);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(DeliveryQueueTest, FifoOrder) {
    DeliveryQueue queue;
    queue.push(frame(1));
    queue.push(frame(2));
    queue.push(frame(3));

    EXPECT_EQ(queue.front(), frame(1));
    EXPECT_EQ(queue.pop(), frame(1));
    EXPECT_EQ(queue.pop(), frame(2));
    EXPECT_EQ(queue.pop(), frame(3));
    EXPECT_TRUE(queue.empty());
}

TEST(DeliveryQueueTest, RequeueRestoresFront) {
    DeliveryQueue queue;
    queue.push(frame(1));
    queue.push(frame(2));

    auto in_flight = queue.pop();
    ASSERT_TRUE(in_flight.has_value());
    queue.requeue_front(std::move(*in_flight));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), frame(1));
    EXPECT_EQ(queue.pop(), frame(2));
}

TEST(DeliveryQueueTest, OrderSurvivesRepeatedFailures) {
    DeliveryQueue queue;
    for (uint8_t i = 0; i < 5; ++i) {
        queue.push(frame(i));
    }

    // two acked, then five failed attempts on the third, with new frames arriving meanwhile
    (void)queue.pop();
    (void)queue.pop();
    for (uint8_t attempt = 0; attempt < 5; ++attempt) {
        auto in_flight = queue.pop();
        ASSERT_TRUE(in_flight.has_value());
        queue.requeue_front(std::move(*in_flight));
        queue.push(frame(static_cast<uint8_t>(10 + attempt)));
    }

    std::vector<uint8_t> order;
    while (auto f = queue.pop()) {
        order.push_back(f->front());
    }
    EXPECT_EQ(order, (std::vector<uint8_t>{2, 3, 4, 10, 11, 12, 13, 14}));
}

TEST(DeliveryQueueTest, UnboundedByDefault) {
    DeliveryQueue queue;
    for (int i = 0; i < 10000; ++i) {
        queue.push(frame(static_cast<uint8_t>(i)));
    }
    EXPECT_EQ(queue.size(), 10000u);
    EXPECT_EQ(queue.dropped(), 0u);
}

TEST(DeliveryQueueTest, CapacityDropsOldest) {
    DeliveryQueue queue(3);
    for (uint8_t i = 1; i <= 5; ++i) {
        queue.push(frame(i));
    }

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(queue.pop(), frame(3));
    EXPECT_EQ(queue.pop(), frame(4));
    EXPECT_EQ(queue.pop(), frame(5));
}

TEST(DeliveryQueueTest, RequeueIgnoresCapacity) {
    DeliveryQueue queue(2);
    queue.push(frame(1));
    queue.push(frame(2));

    auto in_flight = queue.pop();
    queue.push(frame(3));
    queue.requeue_front(std::move(*in_flight));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 0u);
    EXPECT_EQ(queue.front(), frame(1));
}

}  // namespace hostwatch::agent::test
