#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>

struct Counter {
    int value = 0;
    std::string owner;
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Counter> map;

    void put(const std::string& key, int value, const std::string& owner = "") {
        auto c = std::make_shared<Counter>();
        c->value = value;
        c->owner = owner;
        map.insert(key, c);
    }
};

// ============================================================================
// Базовые операции
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    put("key1", 42, "alice");

    auto found = map.find("key1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
    EXPECT_EQ(found->owner, "alice");
}

TEST_F(ThreadSafeMapTest, FindNonExistent_ReturnsNull) {
    EXPECT_EQ(map.find("nonexistent"), nullptr);
    EXPECT_FALSE(map.contains("nonexistent"));
}

TEST_F(ThreadSafeMapTest, Find_ReturnsSnapshot) {
    put("key", 1);

    auto snapshot = map.find("key");
    snapshot->value = 100;

    // Изменение копии не влияет на хранимое значение
    EXPECT_EQ(map.find("key")->value, 1);
}

TEST_F(ThreadSafeMapTest, Update_ExistingKey_AppliesMutator) {
    put("key", 1);

    bool applied = map.update("key", [](Counter& c) {
        c.value += 10;
        return true;
    });

    EXPECT_TRUE(applied);
    EXPECT_EQ(map.find("key")->value, 11);
}

TEST_F(ThreadSafeMapTest, Update_MissingKey_ReturnsFalse) {
    bool called = false;
    bool applied = map.update("missing", [&called](Counter&) {
        called = true;
        return true;
    });

    EXPECT_FALSE(applied);
    EXPECT_FALSE(called);
}

TEST_F(ThreadSafeMapTest, Update_MutatorRejects_ReturnsFalse) {
    put("key", 5);

    bool applied = map.update("key", [](Counter& c) { return c.value > 100; });

    EXPECT_FALSE(applied);
    EXPECT_EQ(map.find("key")->value, 5);
}

TEST_F(ThreadSafeMapTest, EraseAndSize) {
    put("a", 1);
    put("b", 2);
    EXPECT_EQ(map.size(), 2u);

    EXPECT_TRUE(map.erase("a"));
    EXPECT_FALSE(map.erase("a"));
    EXPECT_EQ(map.size(), 1u);
    EXPECT_FALSE(map.contains("a"));
}

TEST_F(ThreadSafeMapTest, EraseIf_RemovesMatching) {
    put("a", 1);
    put("b", 20);
    put("c", 30);

    size_t removed = map.eraseIf([](const Counter& c) { return c.value >= 20; });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_TRUE(map.contains("a"));
}

// ============================================================================
// Многопоточность
// ============================================================================

TEST_F(ThreadSafeMapTest, ConcurrentUpdates_NoLostIncrements) {
    put("shared", 0);

    const int THREADS = 8;
    const int INCREMENTS = 500;
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < INCREMENTS; ++i) {
                map.update("shared", [](Counter& c) {
                    ++c.value;
                    return true;
                });
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.find("shared")->value, THREADS * INCREMENTS);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_ReadersAlwaysSeeValue) {
    put("key", 0);

    std::vector<std::thread> threads;
    std::atomic<int> reads(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                put("key", writer * 100 + i);
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &reads]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find("key");
                ASSERT_NE(found, nullptr);
                reads++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(reads, 400);
}
