#include <gtest/gtest.h>
#include "tiered_cache_manager.hpp"
#include "cache_logger.hpp"
#include "metrics.hpp"
#include "test_helpers.hpp"
#include <sqlite3.h>
#include <chrono>
#include <thread>

using namespace voicecache;
using voicecache::test_support::FakeBackend;
using voicecache::test_support::TempDatabase;

class TieredCacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        CacheLogger::set_min_level(CacheLogger::Level::CRITICAL);
        MetricsRegistry::instance().reset();
        config = voicecache::test_support::unreachable_redis_config();
        config.sqlite_path = db.path();
    }

    void TearDown() override {
        CacheLogger::set_min_level(CacheLogger::Level::INFO);
    }

    // Manager over two scripted backends; the raw pointers stay valid for the manager's lifetime.
    std::unique_ptr<TieredCacheManager> make_fake_manager(bool primary_up, bool secondary_up) {
        auto p = std::make_unique<FakeBackend>("fake_a", primary_up);
        auto s = std::make_unique<FakeBackend>("fake_b", secondary_up);
        primary = p.get();
        secondary = s.get();
        return std::make_unique<TieredCacheManager>(config, std::move(p), std::move(s));
    }

    TempDatabase db;
    CacheConfig config;
    FakeBackend* primary = nullptr;
    FakeBackend* secondary = nullptr;
};

TEST_F(TieredCacheManagerTest, LifecycleOnSqlite) {
    config.backend = BackendKind::Sqlite;
    TieredCacheManager manager(config);
    ASSERT_EQ(manager.active_tier(), CacheTier::Primary);

    Embedding e = {0.1f, 0.2f, 0.3f};
    EXPECT_TRUE(manager.set_embedding("u1", e));
    ASSERT_TRUE(manager.get_embedding("u1").has_value());
    EXPECT_EQ(*manager.get_embedding("u1"), e);
    EXPECT_TRUE(manager.delete_embedding("u1"));
    EXPECT_FALSE(manager.get_embedding("u1").has_value());
    EXPECT_FALSE(manager.delete_embedding("u1"));
}

TEST_F(TieredCacheManagerTest, BothBackendsDownUsesVolatile) {
    config.sqlite_path = "/nonexistent_voicecache_dir/cache.db";
    TieredCacheManager manager(config);

    Embedding e = {1.0f, 2.0f};
    EXPECT_TRUE(manager.set_embedding("u2", e));

    CacheInfo info = manager.get_cache_info();
    EXPECT_EQ(info.active_backend, "volatile");
    EXPECT_EQ(info.active_tier, CacheTier::Volatile);
    EXPECT_EQ(info.status, "fallback_only");
    EXPECT_EQ(info.configured_backend, "redis");
    EXPECT_EQ(info.volatile_entries, 1u);

    ASSERT_TRUE(manager.get_embedding("u2").has_value());
    EXPECT_EQ(*manager.get_embedding("u2"), e);
    EXPECT_TRUE(manager.exists_embedding("u2"));
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kFallbackWrites), 1.0);
}

TEST_F(TieredCacheManagerTest, PrimaryDownAtStartupUsesSecondary) {
    TieredCacheManager manager(config);

    CacheInfo info = manager.get_cache_info();
    EXPECT_EQ(info.configured_backend, "redis");
    EXPECT_EQ(info.active_backend, "sqlite");
    EXPECT_EQ(info.active_tier, CacheTier::Secondary);
    EXPECT_EQ(info.status, "connected");

    EXPECT_TRUE(manager.set_embedding("carol", {4.0f}));
    EXPECT_EQ(manager.get_cache_info().volatile_entries, 0u);
    EXPECT_TRUE(manager.exists_embedding("carol"));
}

TEST_F(TieredCacheManagerTest, OverwriteReturnsLatest) {
    config.backend = BackendKind::Sqlite;
    TieredCacheManager manager(config);

    EXPECT_TRUE(manager.set_embedding("k", {1.0f}));
    EXPECT_TRUE(manager.set_embedding("k", {2.0f, 2.5f}));
    EXPECT_EQ(*manager.get_embedding("k"), (Embedding{2.0f, 2.5f}));
}

TEST_F(TieredCacheManagerTest, RejectsInvalidInput) {
    config.embedding_dim = 2;
    auto manager = make_fake_manager(true, true);

    EXPECT_FALSE(manager->set_embedding("", {1.0f, 2.0f}));
    EXPECT_FALSE(manager->set_embedding("dim", {1.0f, 2.0f, 3.0f}));
    EXPECT_FALSE(manager->exists_embedding("dim"));
    EXPECT_TRUE(manager->set_embedding("dim", {1.0f, 2.0f}));
}

TEST_F(TieredCacheManagerTest, NonPositiveTtlUsesDefault) {
    auto manager = make_fake_manager(true, true);

    EXPECT_TRUE(manager->set_embedding("ttl", {1.0f}, 0));
    EXPECT_TRUE(manager->set_embedding("ttl_neg", {1.0f}, -5));
    EXPECT_TRUE(manager->exists_embedding("ttl"));
    EXPECT_TRUE(manager->exists_embedding("ttl_neg"));
}

TEST_F(TieredCacheManagerTest, FetchOrFailThrowsWithKey) {
    auto manager = make_fake_manager(true, true);

    try {
        manager->get_cached_embedding_or_fail("ghost");
        FAIL() << "expected EmbeddingNotFound";
    } catch (const EmbeddingNotFound& e) {
        EXPECT_EQ(e.user_key(), "ghost");
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
        EXPECT_NE(std::string(e.remediation()).find("cache_voice"), std::string::npos);
    }

    ASSERT_TRUE(manager->set_embedding("ghost", {9.0f}));
    EXPECT_EQ(manager->get_cached_embedding_or_fail("ghost"), (Embedding{9.0f}));
}

TEST_F(TieredCacheManagerTest, RuntimeDemotion) {
    auto manager = make_fake_manager(true, true);
    ASSERT_EQ(manager->active_tier(), CacheTier::Primary);
    ASSERT_TRUE(manager->set_embedding("before", {1.0f}));
    EXPECT_EQ(primary->size(), 1u);

    primary->set_up(false);

    EXPECT_TRUE(manager->set_embedding("after", {2.0f}));
    EXPECT_EQ(manager->active_tier(), CacheTier::Secondary);
    EXPECT_EQ(manager->get_cache_info().active_backend, "fake_b");
    EXPECT_EQ(secondary->size(), 1u);
    EXPECT_EQ(*manager->get_embedding("after"), (Embedding{2.0f}));
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kDemotions), 1.0);

    secondary->set_up(false);

    EXPECT_TRUE(manager->set_embedding("last", {3.0f}));
    EXPECT_EQ(manager->active_tier(), CacheTier::Volatile);
    EXPECT_EQ(*manager->get_embedding("last"), (Embedding{3.0f}));
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kDemotions), 2.0);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge(metric::kActiveTier), 2.0);
}

TEST_F(TieredCacheManagerTest, ReadFailureDemotesAndMisses) {
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("only_on_primary", {1.0f}));

    primary->set_up(false);

    EXPECT_FALSE(manager->get_embedding("only_on_primary").has_value());
    EXPECT_EQ(manager->active_tier(), CacheTier::Secondary);
}

TEST_F(TieredCacheManagerTest, ReprobePromotesAfterConsecutiveSuccesses) {
    config.promote_after_successes = 3;
    auto manager = make_fake_manager(false, true);
    ASSERT_EQ(manager->active_tier(), CacheTier::Secondary);

    primary->set_up(true);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    EXPECT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_EQ(manager->get_cache_info().active_backend, "fake_a");
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kPromotions), 1.0);
}

TEST_F(TieredCacheManagerTest, FlappingBackendStaysDemoted) {
    config.promote_after_successes = 2;
    auto manager = make_fake_manager(false, true);

    primary->set_up(true);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    primary->set_up(false);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    primary->set_up(true);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    EXPECT_EQ(manager->reprobe(), CacheTier::Primary);
}

TEST_F(TieredCacheManagerTest, PromotedWriteClearsVolatileCopy) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(false, false);
    ASSERT_EQ(manager->active_tier(), CacheTier::Volatile);

    ASSERT_TRUE(manager->set_embedding("k", {1.0f}));
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 1u);

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);

    ASSERT_TRUE(manager->set_embedding("k", {2.0f}));
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 0u);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{2.0f}));
}

TEST_F(TieredCacheManagerTest, VolatileHitAfterPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(false, false);
    ASSERT_TRUE(manager->set_embedding("stranded", {5.0f}));

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);

    // Copied onto the primary during promotion; the fallback copy is gone.
    EXPECT_EQ(primary->size(), 1u);
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 0u);
    EXPECT_EQ(*manager->get_embedding("stranded"), (Embedding{5.0f}));
    EXPECT_TRUE(manager->delete_embedding("stranded"));
    EXPECT_FALSE(manager->exists_embedding("stranded"));
}

TEST_F(TieredCacheManagerTest, OverwriteDuringOutageSurvivesPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("k", {1.0f}));

    primary->set_up(false);
    ASSERT_TRUE(manager->set_embedding("k", {2.0f}));
    ASSERT_EQ(manager->active_tier(), CacheTier::Secondary);

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{2.0f}));
}

TEST_F(TieredCacheManagerTest, DeleteDuringOutageSurvivesPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("k", {1.0f}));

    primary->set_up(false);
    manager->delete_embedding("k");
    ASSERT_EQ(manager->active_tier(), CacheTier::Secondary);

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_FALSE(manager->exists_embedding("k"));
    EXPECT_FALSE(manager->get_embedding("k").has_value());
    EXPECT_EQ(primary->size(), 0u);
}

TEST_F(TieredCacheManagerTest, VolatileOverwriteSurvivesPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("k", {1.0f}));

    primary->set_up(false);
    secondary->set_up(false);
    ASSERT_TRUE(manager->set_embedding("k", {3.0f}));
    ASSERT_EQ(manager->active_tier(), CacheTier::Volatile);

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{3.0f}));
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 0u);
}

TEST_F(TieredCacheManagerTest, OutageWritesReachPrimaryAfterSecondaryPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("k", {1.0f}));

    primary->set_up(false);
    secondary->set_up(false);
    ASSERT_TRUE(manager->set_embedding("k", {4.0f}));

    // Only the secondary recovers first; it catches up but the journal is kept.
    secondary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Secondary);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{4.0f}));

    primary->set_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{4.0f}));
}

TEST_F(TieredCacheManagerTest, PrimaryDroppingDuringCatchUpPostponesPromotion) {
    config.promote_after_successes = 1;
    auto manager = make_fake_manager(true, true);
    primary->set_up(false);
    ASSERT_TRUE(manager->set_embedding("k", {2.0f}));
    ASSERT_EQ(manager->active_tier(), CacheTier::Secondary);

    // Accepts connections but drops every write.
    primary->set_up(true);
    primary->set_writes_up(false);
    EXPECT_EQ(manager->reprobe(), CacheTier::Secondary);
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kPromotions), 0.0);

    primary->set_writes_up(true);
    ASSERT_EQ(manager->reprobe(), CacheTier::Primary);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{2.0f}));
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kPromotions), 1.0);
}

TEST_F(TieredCacheManagerTest, HugeTtlIsClamped) {
    auto manager = make_fake_manager(false, false);
    ASSERT_EQ(manager->active_tier(), CacheTier::Volatile);

    EXPECT_TRUE(manager->set_embedding("k", {1.0f}, 10000000000000000LL));
    ASSERT_TRUE(manager->get_embedding("k").has_value());
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{1.0f}));
}

TEST_F(TieredCacheManagerTest, HugeTtlIsClampedOnDurableTier) {
    auto manager = make_fake_manager(true, true);

    EXPECT_TRUE(manager->set_embedding("k", {1.0f}, 10000000000000000LL));
    EXPECT_EQ(primary->size(), 1u);
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 0u);
    EXPECT_EQ(*manager->get_embedding("k"), (Embedding{1.0f}));
}

TEST_F(TieredCacheManagerTest, CleanupExpired) {
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("durable_short", {1.0f}, 1));
    ASSERT_TRUE(manager->set_embedding("durable_long", {1.0f}, 60));

    primary->set_up(false);
    secondary->set_up(false);
    ASSERT_TRUE(manager->set_embedding("volatile_short", {1.0f}, 1));
    ASSERT_EQ(manager->active_tier(), CacheTier::Volatile);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_EQ(manager->cleanup_expired(), 1u);
    EXPECT_EQ(manager->get_cache_info().volatile_entries, 0u);
}

TEST_F(TieredCacheManagerTest, CleanupSweepsDurableTier) {
    auto manager = make_fake_manager(true, true);
    ASSERT_TRUE(manager->set_embedding("a", {1.0f}, 1));
    ASSERT_TRUE(manager->set_embedding("b", {1.0f}, 1));
    ASSERT_TRUE(manager->set_embedding("c", {1.0f}, 60));

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_EQ(manager->cleanup_expired(), 2u);
    EXPECT_EQ(primary->size(), 1u);
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kExpiredPurged), 2.0);
}

TEST_F(TieredCacheManagerTest, ExpiredEntryIsAbsent) {
    config.backend = BackendKind::Sqlite;
    TieredCacheManager manager(config);
    ASSERT_TRUE(manager.set_embedding("short", {1.0f}, 1));

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(manager.exists_embedding("short"));
    EXPECT_FALSE(manager.get_embedding("short").has_value());
}

TEST_F(TieredCacheManagerTest, CorruptEntryIsAMiss) {
    config.backend = BackendKind::Sqlite;
    TieredCacheManager manager(config);

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.path().c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "INSERT INTO speaker_embeddings (user_key, payload, created_at, expires_at) "
                                "VALUES ('bad', x'00', 1, 99999999999999)", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_FALSE(manager.get_embedding("bad").has_value());
    EXPECT_EQ(manager.active_tier(), CacheTier::Primary);
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kCorruptPayloads), 1.0);
    EXPECT_FALSE(manager.exists_embedding("bad"));
}

TEST_F(TieredCacheManagerTest, ConcurrentAccessDuringDemotion) {
    auto manager = make_fake_manager(true, true);
    const int num_threads = 8;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = "user_" + std::to_string((t * 200 + i) % 40);
                EXPECT_TRUE(manager->set_embedding(key, {static_cast<float>(i)}));
                manager->get_embedding(key);
                if (t == 0 && i == 100) primary->set_up(false);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(manager->active_tier(), CacheTier::Secondary);
    EXPECT_EQ(MetricsRegistry::instance().get_counter(metric::kDemotions), 1.0);
}
