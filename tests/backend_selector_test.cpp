#include "storage/backend_selector.hpp"
#include "storage/errors.hpp"
#include "storage/memory_backend.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace notes {

// ── parse_backend_kind() ──────────────────────────────────────────────────────

TEST(BackendKindTest, ParsesCanonicalNamesAndAliases) {
    EXPECT_EQ(parse_backend_kind("memory"),       BackendKind::Memory);
    EXPECT_EQ(parse_backend_kind("remote-cache"), BackendKind::RemoteCache);
    EXPECT_EQ(parse_backend_kind("redis"),        BackendKind::RemoteCache);
    EXPECT_EQ(parse_backend_kind("object-store"), BackendKind::ObjectStore);
    EXPECT_EQ(parse_backend_kind("gcs"),          BackendKind::ObjectStore);
}

TEST(BackendKindTest, IsCaseInsensitive) {
    EXPECT_EQ(parse_backend_kind("Memory"),       BackendKind::Memory);
    EXPECT_EQ(parse_backend_kind("REDIS"),        BackendKind::RemoteCache);
    EXPECT_EQ(parse_backend_kind("Object-Store"), BackendKind::ObjectStore);
}

TEST(BackendKindTest, RejectsUnknownValues) {
    EXPECT_FALSE(parse_backend_kind("").has_value());
    EXPECT_FALSE(parse_backend_kind("cassandra").has_value());
    EXPECT_FALSE(parse_backend_kind(" memory").has_value());
}

TEST(BackendKindTest, ToStringNamesEachKind) {
    EXPECT_EQ(to_string(BackendKind::Memory),      "memory");
    EXPECT_EQ(to_string(BackendKind::RemoteCache), "remote-cache");
    EXPECT_EQ(to_string(BackendKind::ObjectStore), "object-store");
}

// ── BackendSelector ───────────────────────────────────────────────────────────

namespace {

// Factory that records the requested kinds and always builds a MemoryBackend.
struct RecordingFactory {
    std::shared_ptr<std::vector<BackendKind>> requested =
        std::make_shared<std::vector<BackendKind>>();

    BackendSelector::Factory factory() const {
        return [requested = requested](BackendKind kind) -> std::unique_ptr<Backend> {
            requested->push_back(kind);
            return std::make_unique<MemoryBackend>();
        };
    }
};

} // anonymous namespace

TEST(BackendSelectorTest, IsLazy) {
    RecordingFactory rec;
    BackendSelector selector{[] { return std::string("memory"); }, rec.factory(),
                             test::null_logger()};
    EXPECT_FALSE(selector.initialized());
    EXPECT_TRUE(rec.requested->empty());

    (void)selector.get();
    EXPECT_TRUE(selector.initialized());
    EXPECT_EQ(rec.requested->size(), 1u);
}

TEST(BackendSelectorTest, PassesParsedKindToFactory) {
    RecordingFactory rec;
    BackendSelector selector{[] { return std::string("Redis"); }, rec.factory(),
                             test::null_logger()};
    (void)selector.get();
    ASSERT_EQ(rec.requested->size(), 1u);
    EXPECT_EQ(rec.requested->front(), BackendKind::RemoteCache);
    EXPECT_EQ(selector.kind(), std::optional<BackendKind>(BackendKind::RemoteCache));
}

TEST(BackendSelectorTest, EmptyValueSelectsMemory) {
    RecordingFactory rec;
    BackendSelector selector{[] { return std::string(); }, rec.factory(),
                             test::null_logger()};
    (void)selector.get();
    EXPECT_EQ(rec.requested->front(), BackendKind::Memory);
}

TEST(BackendSelectorTest, UnknownValueFallsBackToMemory) {
    RecordingFactory rec;
    BackendSelector selector{[] { return std::string("cassandra"); }, rec.factory(),
                             test::null_logger()};
    (void)selector.get();
    EXPECT_EQ(rec.requested->front(), BackendKind::Memory);
    EXPECT_EQ(selector.kind(), std::optional<BackendKind>(BackendKind::Memory));
}

TEST(BackendSelectorTest, KindIsUnsetBeforeConstruction) {
    RecordingFactory rec;
    BackendSelector selector{[] { return std::string("redis"); }, rec.factory(),
                             test::null_logger()};
    EXPECT_FALSE(selector.kind().has_value());

    (void)selector.get();
    EXPECT_EQ(selector.kind(), std::optional<BackendKind>(BackendKind::RemoteCache));
}

TEST(BackendSelectorTest, KindIsUnsetAfterFailedConstruction) {
    BackendSelector selector{
        [] { return std::string("object-store"); },
        [](BackendKind) -> std::unique_ptr<Backend> {
            throw BackendUnavailableError("object store bucket is not configured");
        },
        test::null_logger()};
    EXPECT_THROW((void)selector.get(), BackendUnavailableError);
    EXPECT_FALSE(selector.kind().has_value());
}

TEST(BackendSelectorTest, KindIsReadableWhileConstructing) {
    std::atomic<bool> started{false};
    BackendSelector selector{
        [] { return std::string("gcs"); },
        [&started](BackendKind) -> std::unique_ptr<Backend> {
            started.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return std::make_unique<MemoryBackend>();
        },
        test::null_logger()};

    std::thread builder([&selector] { (void)selector.get(); });
    while (!started.load()) {
        std::this_thread::yield();
    }
    const auto during = selector.kind();
    builder.join();

    EXPECT_TRUE(!during.has_value() || *during == BackendKind::ObjectStore);
    EXPECT_EQ(selector.kind(), std::optional<BackendKind>(BackendKind::ObjectStore));
}

TEST(BackendSelectorTest, SourceIsReadOnlyOnce) {
    int reads = 0;
    RecordingFactory rec;
    BackendSelector selector{[&reads] { ++reads; return std::string("memory"); },
                             rec.factory(), test::null_logger()};
    Backend& first  = selector.get();
    Backend& second = selector.get();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(reads, 1);
}

TEST(BackendSelectorTest, ConcurrentFirstCallersShareOneInstance) {
    std::atomic<int> constructed{0};
    BackendSelector selector{
        [] { return std::string("memory"); },
        [&constructed](BackendKind) -> std::unique_ptr<Backend> {
            constructed.fetch_add(1);
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return std::make_unique<MemoryBackend>();
        },
        test::null_logger()};

    constexpr int kThreads = 16;
    std::vector<Backend*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&selector, &seen, i] { seen[i] = &selector.get(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(constructed.load(), 1);
    EXPECT_EQ(std::set<Backend*>(seen.begin(), seen.end()).size(), 1u);
}

TEST(BackendSelectorTest, FailedConstructionIsRetried) {
    int attempts = 0;
    BackendSelector selector{
        [] { return std::string("redis"); },
        [&attempts](BackendKind) -> std::unique_ptr<Backend> {
            if (++attempts == 1) {
                throw BackendUnavailableError("remote cache misconfigured");
            }
            return std::make_unique<MemoryBackend>();
        },
        test::null_logger()};

    EXPECT_THROW((void)selector.get(), BackendUnavailableError);
    EXPECT_FALSE(selector.initialized());

    EXPECT_NO_THROW((void)selector.get());
    EXPECT_TRUE(selector.initialized());
    EXPECT_EQ(attempts, 2);
}

TEST(BackendSelectorTest, NullFactoryResultIsAnError) {
    BackendSelector selector{[] { return std::string("memory"); },
                             [](BackendKind) -> std::unique_ptr<Backend> { return nullptr; },
                             test::null_logger()};
    EXPECT_THROW((void)selector.get(), std::runtime_error);
    EXPECT_FALSE(selector.initialized());
}

// ── make_backend_factory() ────────────────────────────────────────────────────

TEST(BackendFactoryTest, BuildsMemoryBackend) {
    test::IocFixture env;
    ServiceConfig cfg{};
    cfg.log_level = "off";
    auto factory = make_backend_factory(cfg, env.ioc);
    EXPECT_EQ(factory(BackendKind::Memory)->name(), "memory");
}

TEST(BackendFactoryTest, BuildsRemoteCacheWithoutConnecting) {
    test::IocFixture env;
    ServiceConfig cfg{};
    cfg.log_level   = "off";
    cfg.redis.port  = 1;
    auto factory = make_backend_factory(cfg, env.ioc);
    EXPECT_EQ(factory(BackendKind::RemoteCache)->name(), "remote-cache");
}

TEST(BackendFactoryTest, ObjectStoreWithoutBucketThrows) {
    test::IocFixture env;
    ServiceConfig cfg{};
    cfg.log_level = "off";
    cfg.object_store.endpoint = "http://127.0.0.1:1";
    auto factory = make_backend_factory(cfg, env.ioc);
    EXPECT_THROW((void)factory(BackendKind::ObjectStore), BackendUnavailableError);
}

TEST(BackendFactoryTest, SelectorSurfacesObjectStoreMisconfiguration) {
    test::IocFixture env;
    ServiceConfig cfg{};
    cfg.log_level = "off";
    cfg.backend   = "object-store";
    BackendSelector selector{[&cfg] { return cfg.backend; },
                             make_backend_factory(cfg, env.ioc), test::null_logger()};
    EXPECT_THROW((void)selector.get(), BackendUnavailableError);
    EXPECT_FALSE(selector.initialized());
}

} // namespace notes
