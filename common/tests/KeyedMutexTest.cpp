#include <gtest/gtest.h>
#include <KeyedMutex.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

class KeyedMutexTest : public ::testing::Test {
protected:
    KeyedMutex<int> locks;
};

TEST_F(KeyedMutexTest, LockAll_SortsAndDeduplicates) {
    auto guard = locks.lockAll({5, 1, 3, 1});

    EXPECT_EQ(guard.keys(), (std::vector<int>{1, 3, 5}));
    EXPECT_TRUE(guard.holds(3));
    EXPECT_FALSE(guard.holds(2));
    EXPECT_EQ(locks.size(), 3u);
}

TEST_F(KeyedMutexTest, Unlock_ReleasesKeys) {
    auto guard = locks.lock(1);
    guard.unlock();

    EXPECT_FALSE(guard.holds(1));
    EXPECT_EQ(locks.size(), 0u);

    // Повторный захват не должен зависнуть
    auto again = locks.lock(1);
    EXPECT_TRUE(again.holds(1));
}

// ============================================
// Жизненный цикл записей таблицы
// ============================================

TEST_F(KeyedMutexTest, ReleasedKeys_AreErasedFromTable) {
    {
        auto guard = locks.lockAll({1, 2, 3});
        EXPECT_EQ(locks.size(), 3u);
    }
    EXPECT_EQ(locks.size(), 0u);
}

TEST_F(KeyedMutexTest, ManyFinishedEntities_LeaveNoEntries) {
    for (int id = 0; id < 10000; ++id) {
        auto guard = locks.lock(id);
    }
    EXPECT_EQ(locks.size(), 0u);
}

TEST_F(KeyedMutexTest, MovedGuard_ReleasesOnce) {
    auto guard = locks.lock(7);
    auto moved = std::move(guard);

    EXPECT_FALSE(guard.holds(7));
    EXPECT_TRUE(moved.holds(7));
    EXPECT_EQ(locks.size(), 1u);

    moved.unlock();
    EXPECT_EQ(locks.size(), 0u);
}

// Ожидающий поток держит запись: она не удаляется, пока он не отпустит ключ
TEST_F(KeyedMutexTest, Waiter_KeepsEntryUntilReleased) {
    auto guard = locks.lock(5);
    std::atomic<bool> acquired{false};

    std::thread waiter([this, &acquired]() {
        auto inner = locks.lock(5);
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(acquired.load());
    EXPECT_EQ(locks.size(), 1u);

    guard.unlock();
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.size(), 0u);
}

TEST_F(KeyedMutexTest, SameKey_IsMutuallyExclusive) {
    const int THREADS = 8;
    const int ITERATIONS = 1000;
    int counter = 0;  // без atomic: защищён ключом 42
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, &counter]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                auto guard = locks.lock(42);
                ++counter;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(counter, THREADS * ITERATIONS);
    EXPECT_EQ(locks.size(), 0u);
}

// Две операции захватывают одни и те же ключи в противоположном порядке
TEST_F(KeyedMutexTest, OppositeOrder_DoesNotDeadlock) {
    const int ITERATIONS = 2000;
    std::atomic<int> done{0};

    std::thread forward([this, &done]() {
        for (int i = 0; i < ITERATIONS; ++i) {
            auto guard = locks.lockAll({1, 2});
            done++;
        }
    });
    std::thread backward([this, &done]() {
        for (int i = 0; i < ITERATIONS; ++i) {
            auto guard = locks.lockAll({2, 1});
            done++;
        }
    });
    forward.join();
    backward.join();

    EXPECT_EQ(done.load(), 2 * ITERATIONS);
    EXPECT_EQ(locks.size(), 0u);
}
