#include <gtest/gtest.h>
#include <KeyedMutex.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

class KeyedMutexTest : public ::testing::Test {
protected:
    KeyedMutex mutexes;
};

TEST_F(KeyedMutexTest, SameKey_SerializesCriticalSection) {
    int counter = 0;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &counter]() {
            for (int i = 0; i < 1000; ++i) {
                auto guard = mutexes.lock("journal-1");
                ++counter;  // без захвата здесь была бы гонка
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counter, 8000);
}

TEST_F(KeyedMutexTest, DifferentKeys_DoNotBlockEachOther) {
    auto first = mutexes.lock("a");

    std::atomic<bool> acquired(false);
    std::thread other([this, &acquired]() {
        auto second = mutexes.lock("b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired);
}

TEST_F(KeyedMutexTest, LockAll_DeduplicatesKeys) {
    // Повторный ключ в наборе не должен приводить к самоблокировке
    auto guard = mutexes.lockAll({"x", "y", "x"});

    EXPECT_EQ(mutexes.size(), 2u);
}

TEST_F(KeyedMutexTest, LockAll_OppositeOrders_NoDeadlock) {
    std::vector<std::thread> threads;
    std::atomic<int> done(0);

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, &done, t]() {
            for (int i = 0; i < 500; ++i) {
                auto guard = (t % 2 == 0) ? mutexes.lockAll({"acc-1", "acc-2"})
                                          : mutexes.lockAll({"acc-2", "acc-1"});
            }
            done++;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(done, 4);
}

TEST_F(KeyedMutexTest, GuardRelease_AllowsRelock) {
    {
        auto guard = mutexes.lock("k");
    }

    std::atomic<bool> acquired(false);
    std::thread other([this, &acquired]() {
        auto guard = mutexes.lock("k");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired);
}

TEST_F(KeyedMutexTest, MovedGuard_KeepsLockUntilDestroyed) {
    KeyedMutex::Guard outer;
    {
        auto inner = mutexes.lock("k");
        outer = std::move(inner);
    }

    std::atomic<bool> acquired(false);
    std::thread other([this, &acquired]() {
        auto guard = mutexes.lock("k");
        acquired = true;
    });

    // Пока outer жив, второй поток ждёт
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired);

    outer = KeyedMutex::Guard();
    other.join();
    EXPECT_TRUE(acquired);
}
