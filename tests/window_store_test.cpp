#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "window_store.hpp"

using namespace pricewatch;

// ============================================================================
// WindowStore Tests
// ============================================================================

TEST(WindowStoreTest, RejectsZeroCapacityOrShards) {
    EXPECT_THROW(WindowStore(0), InvalidConfigError);
    EXPECT_THROW(WindowStore(300, 0), InvalidConfigError);
}

TEST(WindowStoreTest, NeverObservedInstrumentIsEmpty) {
    WindowStore store(300);
    EXPECT_TRUE(store.get("RELIANCE").empty());
    EXPECT_FALSE(store.contains("RELIANCE"));

    WindowSnapshot snap = store.snapshot("RELIANCE");
    EXPECT_EQ(snap.instrument, "RELIANCE");
    EXPECT_TRUE(snap.samples.empty());
    EXPECT_FALSE(snap.previous_close.has_value());
}

TEST(WindowStoreTest, CreatesWindowLazilyOnAppend) {
    WindowStore store(300);
    store.append("TCS", Observation(1000, 3500.0), 3490.0);

    EXPECT_TRUE(store.contains("TCS"));
    auto samples = store.get("TCS");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_DOUBLE_EQ(samples[0].price, 3500.0);
    EXPECT_DOUBLE_EQ(*store.snapshot("TCS").previous_close, 3490.0);
}

TEST(WindowStoreTest, WindowsAreIndependentPerInstrument) {
    WindowStore store(2);
    store.append("INFY", Observation(1, 1500.0), 1490.0);
    store.append("INFY", Observation(2, 1501.0), 1490.0);
    store.append("INFY", Observation(3, 1502.0), 1490.0);
    store.append("SBIN", Observation(1, 600.0), 595.0);

    EXPECT_EQ(store.get("INFY").size(), 2u);
    EXPECT_EQ(store.get("SBIN").size(), 1u);
    EXPECT_DOUBLE_EQ(*store.snapshot("SBIN").previous_close, 595.0);

    auto names = store.instruments();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "INFY");
    EXPECT_EQ(names[1], "SBIN");
}

TEST(WindowStoreTest, ShardAssignmentIsStable) {
    WindowStore store(300, 16);
    uint32_t shard = store.get_shard_for_instrument("HDFCBANK");
    EXPECT_LT(shard, 16u);
    EXPECT_EQ(store.get_shard_for_instrument("HDFCBANK"), shard);
}

TEST(WindowStoreTest, ConcurrentAppendsRespectCapacity) {
    WindowStore store(50, 4);
    const std::vector<std::string> names = {"RELIANCE", "TCS", "INFY", "ITC"};

    std::vector<std::thread> threads;
    for (const auto& name : names) {
        threads.emplace_back([&store, name]() {
            for (uint64_t i = 0; i < 200; ++i) {
                store.append(name, Observation(i, 100.0 + static_cast<double>(i)), 99.0);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& name : names) {
        auto samples = store.get(name);
        ASSERT_EQ(samples.size(), 50u);
        EXPECT_DOUBLE_EQ(samples.back().price, 299.0);
        EXPECT_EQ(store.snapshot(name).version, 200u);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
