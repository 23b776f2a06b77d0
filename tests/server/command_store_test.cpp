#include "hostwatch/server/command_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace hostwatch::server::test {

using proto::CollectorId;
using proto::TaskType;

TEST(CommandStoreTest, TakeFromEmpty) {
    CommandStore store;
    EXPECT_FALSE(store.take(CollectorId::from_u64(1)).has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(CommandStoreTest, TakeConsumes) {
    CommandStore store;
    store.set(CollectorId::from_u64(42), TaskType::Shutdown);
    EXPECT_EQ(store.size(), 1u);

    auto task = store.take(CollectorId::from_u64(42));
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(*task, TaskType::Shutdown);

    EXPECT_FALSE(store.take(CollectorId::from_u64(42)).has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(CommandStoreTest, LastWriterWins) {
    CommandStore store;
    store.set(CollectorId::from_u64(7), TaskType::Shutdown);
    store.set(CollectorId::from_u64(7), TaskType::Shutdown);
    EXPECT_EQ(store.size(), 1u);

    EXPECT_TRUE(store.take(CollectorId::from_u64(7)).has_value());
    EXPECT_FALSE(store.take(CollectorId::from_u64(7)).has_value());
}

TEST(CommandStoreTest, KeyedByCollector) {
    CommandStore store;
    store.set(CollectorId::from_u64(1), TaskType::Shutdown);

    EXPECT_FALSE(store.take(CollectorId::from_u64(2)).has_value());
    EXPECT_FALSE(store.take(CollectorId{1, 0}).has_value());
    EXPECT_TRUE(store.take(CollectorId::from_u64(1)).has_value());
}

TEST(CommandStoreTest, AtMostOnceUnderContention) {
    CommandStore store;
    constexpr int kRounds = 200;
    constexpr int kThreads = 8;

    for (int round = 0; round < kRounds; ++round) {
        store.set(CollectorId::from_u64(42), TaskType::Shutdown);

        std::atomic<int> taken{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&] {
                if (store.take(CollectorId::from_u64(42))) {
                    ++taken;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        ASSERT_EQ(taken.load(), 1) << "round " << round;
    }
}

}  // namespace hostwatch::server::test
