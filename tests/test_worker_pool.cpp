#include <gtest/gtest.h>
#include "../src/scan/WorkerPool.h"
#include "../src/core/Logging.h"
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace lan_probe {

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
};

TEST_F(WorkerPoolTest, RunsEveryIndexExactlyOnce) {
    WorkerPool pool(8);
    std::vector<std::atomic<int>> hits(500);
    size_t started = pool.run(hits.size(), deadline_in(std::chrono::seconds(10)), [&](size_t i){ hits[i]++; });
    EXPECT_EQ(started, hits.size());
    for (auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST_F(WorkerPoolTest, NeverExceedsWorkerLimit) {
    WorkerPool pool(4);
    std::atomic<int> active{0}, peak{0};
    pool.run(40, deadline_in(std::chrono::seconds(10)), [&](size_t){
        int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --active;
    });
    EXPECT_LE(peak.load(), 4);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(WorkerPoolTest, ExpiredDeadlineStartsNothing) {
    WorkerPool pool(4);
    std::atomic<int> calls{0};
    size_t started = pool.run(10, Clock::now() - std::chrono::milliseconds(1), [&](size_t){ calls++; });
    EXPECT_EQ(started, 0u);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(WorkerPoolTest, StopsLaunchingAfterDeadline) {
    WorkerPool pool(2);
    std::atomic<int> calls{0};
    size_t started = pool.run(100, deadline_in(std::chrono::milliseconds(50)), [&](size_t){
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });
    EXPECT_LT(started, 100u);
    EXPECT_EQ(static_cast<size_t>(calls.load()), started);
}

TEST_F(WorkerPoolTest, ThrowingTaskDoesNotStopOthers) {
    WorkerPool pool(3);
    std::atomic<int> ok{0};
    size_t started = pool.run(30, deadline_in(std::chrono::seconds(10)), [&](size_t i){
        if (i % 5 == 0) throw std::runtime_error("socket exploded");
        ok++;
    });
    EXPECT_EQ(started, 30u);
    EXPECT_EQ(ok.load(), 24);
}

TEST_F(WorkerPoolTest, ZeroWorkersRunsInline) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.max_workers(), 1u);
    std::vector<size_t> order;
    pool.run(5, deadline_in(std::chrono::seconds(1)), [&](size_t i){ order.push_back(i); });
    EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST_F(WorkerPoolTest, EmptyRun) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.run(0, deadline_in(std::chrono::seconds(1)), [](size_t){ FAIL(); }), 0u);
}

TEST_F(WorkerPoolTest, HugeWorkerCountIsCapped) {
    WorkerPool pool(100000);
    EXPECT_EQ(pool.max_workers(), WorkerPool::kMaxWorkers);
    std::atomic<int> active{0}, peak{0};
    std::vector<std::atomic<int>> hits(2000);
    size_t started = pool.run(hits.size(), deadline_in(std::chrono::seconds(30)), [&](size_t i){
        int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        hits[i]++;
        --active;
    });
    EXPECT_EQ(started, hits.size());
    EXPECT_LE(peak.load(), static_cast<int>(WorkerPool::kMaxWorkers));
    for (auto& h : hits) EXPECT_EQ(h.load(), 1);
}

}
