#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "tasks.hpp"

using namespace std::chrono_literals;

namespace {

// Spins until pred() holds or two seconds pass
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // namespace

TEST(TaskExecutor, RejectsZeroSizes) {
    EXPECT_THROW(tasks::TaskExecutor(0, 4), std::invalid_argument);
    EXPECT_THROW(tasks::TaskExecutor(1, 0), std::invalid_argument);
}

TEST(TaskExecutor, SingleWorkerRunsInOrder) {
    std::mutex mutex;
    std::vector<int> order;
    std::atomic<int> done{0};
    tasks::TaskExecutor lane(1, 16);

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(lane.submit([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
            ++done;
        }));
    }
    ASSERT_TRUE(eventually([&] { return done == 10; }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(TaskExecutor, FullQueueRefusesWork) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};
    tasks::TaskExecutor lane(1, 2);

    ASSERT_TRUE(lane.submit([&started, gate] {
        started = true;
        gate.wait();
    }));
    ASSERT_TRUE(eventually([&] { return started.load(); }));

    EXPECT_TRUE(lane.submit([] {}));
    EXPECT_TRUE(lane.submit([] {}));
    EXPECT_FALSE(lane.submit([] {}));
    EXPECT_EQ(lane.pending(), 2u);

    release.set_value();
    EXPECT_TRUE(eventually([&] { return lane.pending() == 0; }));
    EXPECT_TRUE(lane.submit([] {}));
}

TEST(TaskExecutor, ExceptionsAreReportedAndWorkerSurvives) {
    std::mutex mutex;
    std::vector<std::string> errors;
    std::atomic<bool> after{false};
    tasks::TaskExecutor lane(1, 4, [&](const std::string& what) {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(what);
    });

    lane.submit([] { throw std::runtime_error("disk full"); });
    lane.submit([&after] { after = true; });
    ASSERT_TRUE(eventually([&] { return after.load(); }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(errors, (std::vector<std::string>{"disk full"}));
}

TEST(TaskExecutor, ShutdownDropsQueuedWork) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};
    std::atomic<int> ran{0};
    tasks::TaskExecutor lane(1, 8);

    lane.submit([&, gate] {
        started = true;
        gate.wait();
        ++ran;
    });
    ASSERT_TRUE(eventually([&] { return started.load(); }));
    lane.submit([&ran] { ++ran; });
    lane.submit([&ran] { ++ran; });

    std::thread releaser([&release] {
        std::this_thread::sleep_for(20ms);
        release.set_value();
    });
    lane.shutdown();
    releaser.join();

    EXPECT_EQ(ran, 1);
    EXPECT_FALSE(lane.submit([] {}));
    lane.shutdown();
}

TEST(TaskExecutor, WorkersRunConcurrently) {
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};
    tasks::TaskExecutor pool(3, 8);

    for (int i = 0; i < 3; ++i) {
        pool.submit([&] {
            int now = ++inside;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(50ms);
            --inside;
            ++done;
        });
    }
    ASSERT_TRUE(eventually([&] { return done == 3; }));
    EXPECT_GT(peak, 1);
}
