#include <gtest/gtest.h>
#include "store/memory_state_store.h"
#include "core/mesh_error.h"
#include <thread>
#include <vector>

using namespace meshcore;
using namespace std::chrono_literals;

class MemoryStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<utils::ManualClock>();
        store = std::make_shared<MemoryStateStore>(clock);
    }

    std::shared_ptr<utils::ManualClock> clock;
    std::shared_ptr<MemoryStateStore> store;
};

TEST_F(MemoryStateStoreTest, SetAndGet) {
    EXPECT_FALSE(store->get("mesh:endpoint:a").has_value());

    store->set("mesh:endpoint:a", "{}");
    ASSERT_TRUE(store->get("mesh:endpoint:a").has_value());
    EXPECT_EQ("{}", *store->get("mesh:endpoint:a"));
    EXPECT_FALSE(store->ttl("mesh:endpoint:a").has_value());
}

TEST_F(MemoryStateStoreTest, KeyExpiresAfterTtl) {
    store->set("k", "v", std::chrono::milliseconds(90000));

    clock->advance(89s);
    EXPECT_TRUE(store->get("k").has_value());

    clock->advance(1s);
    EXPECT_FALSE(store->get("k").has_value());
    EXPECT_FALSE(store->exists("k"));
}

TEST_F(MemoryStateStoreTest, SetWithoutTtlClearsExpiry) {
    store->set("k", "v", std::chrono::milliseconds(1000));
    store->set("k", "w");

    clock->advance(1h);
    EXPECT_EQ("w", store->get("k").value());
}

TEST_F(MemoryStateStoreTest, ExpireOnlyExistingKeys) {
    EXPECT_FALSE(store->expire("missing", 10s));

    store->setAdd("mesh:appid:auth", "i-1");
    EXPECT_TRUE(store->expire("mesh:appid:auth", 10s));
    EXPECT_EQ(10000, store->ttl("mesh:appid:auth")->count());

    clock->advance(10s);
    EXPECT_TRUE(store->setMembers("mesh:appid:auth").empty());
}

TEST_F(MemoryStateStoreTest, SetOperations) {
    EXPECT_TRUE(store->setAdd("s", "b"));
    EXPECT_TRUE(store->setAdd("s", "a"));
    EXPECT_FALSE(store->setAdd("s", "a"));

    EXPECT_EQ((std::vector<std::string>{"a", "b"}), store->setMembers("s"));

    EXPECT_TRUE(store->setRemove("s", "a"));
    EXPECT_FALSE(store->setRemove("s", "a"));
    EXPECT_TRUE(store->setRemove("s", "b"));

    // An emptied set disappears
    EXPECT_FALSE(store->exists("s"));
}

TEST_F(MemoryStateStoreTest, RemoveReportsExistence) {
    store->set("k", "v");
    EXPECT_TRUE(store->remove("k"));
    EXPECT_FALSE(store->remove("k"));
}

TEST_F(MemoryStateStoreTest, WrongTypeAccessThrows) {
    store->setAdd("s", "m");
    EXPECT_THROW(store->get("s"), std::logic_error);

    store->set("k", "v");
    EXPECT_THROW(store->setAdd("k", "m"), std::logic_error);
}

TEST_F(MemoryStateStoreTest, AtomicUpdateSeesCurrentValue) {
    auto result = store->atomicUpdate("counter", [](const std::optional<std::string>& current) {
        EXPECT_FALSE(current.has_value());
        return std::optional<std::string>("1");
    });
    EXPECT_EQ("1", result.value());

    auto unchanged = store->atomicUpdate("counter", [](const std::optional<std::string>&) {
        return std::optional<std::string>();
    });
    EXPECT_EQ("1", unchanged.value());
}

TEST_F(MemoryStateStoreTest, ConcurrentAtomicUpdatesNeverLoseIncrements) {
    const int threads = 8;
    const int perThread = 250;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this]() {
            for (int i = 0; i < perThread; ++i) {
                store->atomicUpdate("counter", [](const std::optional<std::string>& current) {
                    int value = current ? std::stoi(*current) : 0;
                    return std::optional<std::string>(std::to_string(value + 1));
                });
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(std::to_string(threads * perThread), store->get("counter").value());
}

TEST_F(MemoryStateStoreTest, OutageThrowsDependencyUnavailable) {
    store->set("k", "v");
    store->setAvailable(false);

    EXPECT_FALSE(store->ping());
    try {
        store->get("k");
        FAIL() << "Expected MeshException";
    } catch (const MeshException& e) {
        EXPECT_EQ(MeshErrorCode::DEPENDENCY_UNAVAILABLE, e.code());
    }
    EXPECT_THROW(store->setAdd("s", "m"), MeshException);

    store->setAvailable(true);
    EXPECT_TRUE(store->ping());
    EXPECT_EQ("v", store->get("k").value());
}

TEST_F(MemoryStateStoreTest, KeyCountSkipsExpired) {
    store->set("a", "1", std::chrono::milliseconds(1000));
    store->set("b", "2");
    EXPECT_EQ(2u, store->keyCount());

    clock->advance(2s);
    EXPECT_EQ(1u, store->keyCount());
}
