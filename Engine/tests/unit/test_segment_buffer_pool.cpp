/**
 * @file test_segment_buffer_pool.cpp
 * @brief Checkout/return discipline of the leaf buffer arena
 */

#include <gtest/gtest.h>
#include <ingestion/segment_buffer_pool.hpp>
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Commpute;

TEST(SegmentBufferPoolTest, RequiresASlot) {
    EXPECT_THROW(SegmentBufferPool(0, 16), std::invalid_argument);
}

TEST(SegmentBufferPoolTest, LeasesAreDistinct) {
    SegmentBufferPool pool(3, 64);
    EXPECT_EQ(pool.capacity(), 3u);
    EXPECT_EQ(pool.buffer_size(), 64u);

    std::vector<SegmentBufferPool::Lease> leases;
    std::set<size_t> indices;
    std::set<const uint8_t*> buffers;
    for (int i = 0; i < 3; ++i) {
        leases.push_back(pool.acquire());
        indices.insert(leases.back().index());
        buffers.insert(leases.back().data());
        EXPECT_EQ(leases.back().size(), 64u);
    }
    EXPECT_EQ(indices.size(), 3u);
    EXPECT_EQ(buffers.size(), 3u);
    EXPECT_EQ(pool.available(), 0u);

    leases.clear();
    EXPECT_EQ(pool.available(), 3u);
}

TEST(SegmentBufferPoolTest, MoveTransfersOwnership) {
    SegmentBufferPool pool(1, 8);
    auto a = pool.acquire();
    SegmentBufferPool::Lease b = std::move(a);

    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(pool.available(), 0u);

    b.release();
    EXPECT_FALSE(b.valid());
    EXPECT_EQ(pool.available(), 1u);
}

TEST(SegmentBufferPoolTest, ReleasedOnException) {
    SegmentBufferPool pool(1, 8);
    try {
        auto lease = pool.acquire();
        throw std::runtime_error("leaf failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(pool.available(), 1u);
}

TEST(SegmentBufferPoolTest, AcquireBlocksUntilRelease) {
    SegmentBufferPool pool(1, 8);
    auto held = pool.acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto lease = pool.acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    pool.wait_idle();
    EXPECT_EQ(pool.available(), 1u);
}

TEST(SegmentBufferPoolTest, NeverExceedsCapacityUnderLoad) {
    SegmentBufferPool pool(2, 8);
    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto lease = pool.acquire();
                int now = ++in_use;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::yield();
                --in_use;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.available(), 2u);
}
