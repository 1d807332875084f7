// tests/reconciler_test.cpp

#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "reconciler.hpp"

using namespace sentry;

namespace {

DetectionResult resultWithId(int id) {
    DetectionResult r;
    Detection d;
    d.box = {0, 0, 1, 1};
    d.categories.push_back({"id", id, 1.0f});
    r.detections.push_back(d);
    return r;
}

int idOf(const DetectionResult& r) {
    return r.detections.at(0).categories.at(0).index;
}

} // namespace

class ResultReconcilerTest : public ::testing::Test {
protected:
    ResultReconciler reconciler{0, DrainPolicy::KEEP_OLDEST, 10};
};

TEST_F(ResultReconcilerTest, DrainOnEmptyReturnsFalse) {
    DetectionResult out;
    EXPECT_FALSE(reconciler.drain(out));
    EXPECT_EQ(reconciler.droppedCount(), 0u);
}

TEST_F(ResultReconcilerTest, KeepsFirstPendingAndDropsTheRest) {
    reconciler.onResult(resultWithId(1), 100);
    reconciler.onResult(resultWithId(2), 133);
    reconciler.onResult(resultWithId(3), 166);

    DetectionResult out;
    ASSERT_TRUE(reconciler.drain(out));
    EXPECT_EQ(idOf(out), 1);
    EXPECT_EQ(out.timestamp_ms, 100);
    EXPECT_EQ(reconciler.droppedCount(), 2u);
    EXPECT_EQ(reconciler.pendingCount(), 0u);

    // Nothing is live until the next callback
    EXPECT_FALSE(reconciler.drain(out));
}

TEST_F(ResultReconcilerTest, KeepNewestPolicyTakesLastEntry) {
    ResultReconciler newest(0, DrainPolicy::KEEP_NEWEST, 10);
    newest.onResult(resultWithId(1), 1);
    newest.onResult(resultWithId(2), 2);

    DetectionResult out;
    ASSERT_TRUE(newest.drain(out));
    EXPECT_EQ(idOf(out), 2);
    EXPECT_EQ(newest.droppedCount(), 1u);
}

TEST_F(ResultReconcilerTest, BoundedQueueEvictsOldest) {
    ResultReconciler bounded(2, DrainPolicy::KEEP_OLDEST, 10);
    bounded.onResult(resultWithId(1), 1);
    bounded.onResult(resultWithId(2), 2);
    bounded.onResult(resultWithId(3), 3);

    EXPECT_EQ(bounded.pendingCount(), 2u);

    DetectionResult out;
    ASSERT_TRUE(bounded.drain(out));
    EXPECT_EQ(idOf(out), 2);

    ReconcilerStats s = bounded.stats();
    EXPECT_EQ(s.evicted, 1u);
    EXPECT_EQ(s.dropped, 2u);  // one evicted, one discarded by drain
    EXPECT_EQ(s.processed, 3u);
    EXPECT_EQ(s.consumed, 1u);
}

TEST_F(ResultReconcilerTest, CallbackCountDrivesFrameRate) {
    using Clock = ResultReconciler::Clock;
    Clock::time_point t0 = Clock::now();

    for (int i = 1; i <= 10; i++) {
        reconciler.onResult(resultWithId(i), i, t0 + std::chrono::milliseconds(50 * i));
    }
    EXPECT_GT(reconciler.fps(), 0.0f);
    EXPECT_EQ(reconciler.stats().processed, 10u);
}

TEST(ResultReconcilerConcurrencyTest, ConcurrentAppendIsNeitherLostNorDuplicated) {
    const int total = 20000;
    ResultReconciler reconciler(0, DrainPolicy::KEEP_OLDEST, 10);
    std::atomic<bool> producing{true};
    std::vector<int> consumed;

    std::thread producer([&]() {
        for (int i = 0; i < total; i++) {
            reconciler.onResult(resultWithId(i), i);
        }
        producing = false;
    });

    DetectionResult out;
    while (producing) {
        if (reconciler.drain(out)) consumed.push_back(idOf(out));
    }
    producer.join();
    while (reconciler.drain(out)) consumed.push_back(idOf(out));

    ReconcilerStats s = reconciler.stats();
    EXPECT_EQ(s.processed, static_cast<uint64_t>(total));
    EXPECT_EQ(s.consumed, consumed.size());
    EXPECT_EQ(s.consumed + s.dropped, static_cast<uint64_t>(total));
    EXPECT_EQ(s.pending, 0u);

    // Consumed ids are unique and in submission order
    std::set<int> unique(consumed.begin(), consumed.end());
    EXPECT_EQ(unique.size(), consumed.size());
    for (size_t i = 1; i < consumed.size(); i++) {
        EXPECT_LT(consumed[i - 1], consumed[i]);
    }
}

TEST(DrainPolicyTest, ParsesNames) {
    EXPECT_EQ(parseDrainPolicy("oldest"), DrainPolicy::KEEP_OLDEST);
    EXPECT_EQ(parseDrainPolicy("newest"), DrainPolicy::KEEP_NEWEST);
    EXPECT_STREQ(drainPolicyName(DrainPolicy::KEEP_NEWEST), "newest");
    EXPECT_THROW(parseDrainPolicy("latest"), std::invalid_argument);
}
