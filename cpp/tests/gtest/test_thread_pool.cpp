// =============================================================================
// ThreadPool Tests
// =============================================================================

#include <gtest/gtest.h>
#include "nbp/thread_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace nbp;

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto f = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
    EXPECT_EQ(pool.num_threads(), 2u);
}

TEST(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<std::atomic<int>> hits(1000);
    for (auto& h : hits) h.store(0);

    pool.parallel_for(0, hits.size(), [&hits](size_t i) { hits[i].fetch_add(1); });

    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "index " << i;
    }
}

TEST(ThreadPoolTest, ParallelForPropagatesExceptions) {
    ThreadPool pool(3);
    EXPECT_THROW(pool.parallel_for(0, 100, [](size_t i) {
        if (i == 42) throw std::runtime_error("boom");
    }), std::runtime_error);

    // Pool stays usable afterwards
    auto f = pool.submit([] { return 7; });
    EXPECT_EQ(f.get(), 7);
}

TEST(ThreadPoolTest, ZeroThreadsClampedToOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.num_threads(), 1u);
    int sum = 0;
    pool.parallel_for(0, 10, [&sum](size_t i) { sum += static_cast<int>(i); });
    EXPECT_EQ(sum, 45);
}
