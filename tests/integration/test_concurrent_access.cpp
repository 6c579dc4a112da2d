#include <gtest/gtest.h>
#include <cloudconnect/cloudconnect.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace cloudconnect;

// ===========================================================================
// Test Fixture
// ===========================================================================

class ConcurrentAccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        register_builtin_types(registry);
        sink = std::make_shared<MemoryLogSink>();
        metrics = std::make_shared<MetricsMonitor>();
        mgr = std::make_unique<ResourceManager>(Config{}, sink, registry);
        mgr->set_monitor(metrics);
    }

    static FieldBag cache_fields() {
        FieldBag f;
        f["ttl_seconds"] = std::int64_t{30};
        f["capacity_mb"] = std::int64_t{32};
        f["eviction_policy"] = std::string("LRU");
        return f;
    }

    ResourceRegistry registry;
    std::shared_ptr<MemoryLogSink> sink;
    std::shared_ptr<MetricsMonitor> metrics;
    std::unique_ptr<ResourceManager> mgr;
};

// ===========================================================================
// Test 1: racing creates of the same name, exactly one wins
// ===========================================================================

TEST_F(ConcurrentAccessTest, SameNameCreateHasOneWinner) {
    constexpr int kThreads = 8;
    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) std::this_thread::yield();
            try {
                mgr->create_resource("CacheDB", "shared", cache_fields());
                created++;
            } catch (const DuplicateNameError&) {
                duplicates++;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(duplicates.load(), kThreads - 1);
    EXPECT_EQ(mgr->resource_count(), 1u);
    EXPECT_EQ(mgr->audit_history("shared").size(), 1u);
    EXPECT_EQ(sink->lines("shared").size(), 1u);
}

// ===========================================================================
// Test 2: racing starts of one resource, exactly one wins
// ===========================================================================

TEST_F(ConcurrentAccessTest, ConcurrentStartHasOneWinner) {
    mgr->create_resource("CacheDB", "cache1", cache_fields());

    constexpr int kThreads = 8;
    std::atomic<int> started{0};
    std::atomic<int> rejected{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) std::this_thread::yield();
            try {
                mgr->start_resource("cache1");
                started++;
            } catch (const InvalidTransitionError&) {
                rejected++;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(mgr->get_resource("cache1")->state, ResourceState::Running);
    EXPECT_EQ(mgr->audit_history("cache1").size(), 2u);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.resources_started, 1u);
    EXPECT_EQ(m.transitions_rejected, static_cast<std::uint64_t>(kThreads - 1));
}

// ===========================================================================
// Test 3: independent resources cycled from many threads
// ===========================================================================

TEST_F(ConcurrentAccessTest, IndependentResourcesCycleInParallel) {
    constexpr int kThreads = 6;
    constexpr int kCycles = 20;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            std::string name = "cache" + std::to_string(i);
            mgr->create_resource("CacheDB", name, cache_fields());
            for (int c = 0; c < kCycles; ++c) {
                mgr->start_resource(name);
                mgr->view_logs(name);
                mgr->stop_resource(name);
            }
            mgr->delete_resource(name);
        });
    }

    // Readers run alongside the writers
    std::thread reader([&]() {
        for (int r = 0; r < 200; ++r) {
            mgr->get_all_resources();
            mgr->resource_count();
        }
    });

    for (auto& t : threads) t.join();
    reader.join();

    EXPECT_EQ(mgr->resource_count(), static_cast<std::size_t>(kThreads));
    for (int i = 0; i < kThreads; ++i) {
        std::string name = "cache" + std::to_string(i);
        EXPECT_EQ(mgr->get_resource(name)->state, ResourceState::Deleted);
        // create + start/stop per cycle + delete
        EXPECT_EQ(mgr->audit_history(name).size(), static_cast<std::size_t>(2 + 2 * kCycles));
    }

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.resources_started, static_cast<std::uint64_t>(kThreads * kCycles));
    EXPECT_EQ(m.transitions_rejected, 0u);
}

// ===========================================================================
// Test 4: sink receives a resource's entries in commit order
// ===========================================================================

TEST_F(ConcurrentAccessTest, SinkOrderMatchesHistoryUnderRaces) {
    mgr->create_resource("CacheDB", "cache1", cache_fields());

    constexpr int kThreads = 4;
    constexpr int kIterations = 500;
    std::atomic<int> committed{0};
    std::atomic<int> rejected{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) std::this_thread::yield();
            for (int n = 0; n < kIterations; ++n) {
                try {
                    mgr->start_resource("cache1");
                    committed++;
                } catch (const InvalidTransitionError&) {
                    rejected++;
                }
                try {
                    mgr->stop_resource("cache1");
                    committed++;
                } catch (const InvalidTransitionError&) {
                    rejected++;
                }
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(committed.load() + rejected.load(), 2 * kThreads * kIterations);

    auto history = mgr->audit_history("cache1");
    auto lines = sink->lines("cache1");
    ASSERT_EQ(history.size(), static_cast<std::size_t>(1 + committed.load()));
    ASSERT_EQ(lines.size(), history.size());

    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto pos = lines[i].find("] ");
        ASSERT_NE(pos, std::string::npos) << lines[i];
        ASSERT_EQ(lines[i].substr(pos + 2), history[i].message) << "at line " << i;
    }

    // Starts and stops strictly alternate after the creation entry
    for (std::size_t i = 1; i < history.size(); ++i) {
        const char* expected = (i % 2 == 1) ? "CacheDB started" : "CacheDB stopped successfully";
        ASSERT_EQ(history[i].message, expected) << "at entry " << i;
    }
}
