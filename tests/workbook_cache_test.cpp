#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/thread_pool.hpp>
#include <sheetfork-cpp/workbook_cache.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <latch>
#include <string>
#include <thread>
#include <vector>

using namespace sheetfork_cpp;
using namespace std::chrono_literals;
using sheetfork_test::CountingLoader;
using sheetfork_test::ScratchDir;
using sheetfork_test::StubWorkbook;
using sheetfork_test::write_file;

namespace {

auto as_stub(const WorkbookHandle& handle) -> const StubWorkbook& {
    return dynamic_cast<const StubWorkbook&>(*handle);
}

auto ids(std::initializer_list<const char*> values) -> std::vector<WorkbookId> {
    auto result = std::vector<WorkbookId>{};
    for (const auto* v : values) result.emplace_back(v);
    return result;
}

class WorkbookCacheTest : public ::testing::Test {
protected:
    // Writes a workbook per name and registers it under "wb-<name>".
    void add_workbooks(WorkbookCache& cache, std::initializer_list<const char*> names) {
        for (const auto* name : names) {
            auto path = dir_ / "workspace" / (std::string{name} + ".xlsx");
            write_file(path, std::string{"contents of "} + name);
            cache.register_location(WorkbookId{std::string{"wb-"} + name}, path);
        }
    }

    auto config(std::size_t capacity) const -> CacheConfig {
        return CacheConfig{.capacity = capacity, .workspace_root = dir_ / "workspace"};
    }

    ScratchDir dir_;
    CountingLoader loader_;
};

}  // namespace

// -- Construction -------------------------------------------------------------

TEST_F(WorkbookCacheTest, zero_capacity_is_rejected) {
    try {
        auto cache = WorkbookCache{config(0), loader_.loader()};
        FAIL() << "expected cache_capacity_misconfigured";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::cache_capacity_misconfigured);
    }
}

TEST_F(WorkbookCacheTest, missing_loader_is_rejected) {
    EXPECT_THROW((WorkbookCache{config(2), WorkbookLoader{}}), EngineError);
}

// -- LRU behaviour ------------------------------------------------------------

TEST_F(WorkbookCacheTest, evicts_least_recently_used) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa", "bbbbbbbbbb", "cccccccccc", "dddddddddd"});

    cache.open_workbook("wb-aaaaaaaaaa");
    cache.open_workbook("wb-bbbbbbbbbb");
    cache.open_workbook("wb-cccccccccc");
    EXPECT_EQ(cache.resident_ids(), ids({"wb-cccccccccc", "wb-bbbbbbbbbb"}));

    cache.open_workbook("wb-bbbbbbbbbb");
    cache.open_workbook("wb-dddddddddd");
    EXPECT_EQ(cache.resident_ids(), ids({"wb-dddddddddd", "wb-bbbbbbbbbb"}));
    EXPECT_EQ(loader_.calls(), 4);
}

TEST_F(WorkbookCacheTest, keeps_the_most_recent_capacity_entries) {
    auto cache = WorkbookCache{config(3), loader_.loader()};
    add_workbooks(cache, {"w1w1w1w1w1", "w2w2w2w2w2", "w3w3w3w3w3", "w4w4w4w4w4",
                          "w5w5w5w5w5", "w6w6w6w6w6"});

    for (const auto* id : {"wb-w1w1w1w1w1", "wb-w2w2w2w2w2", "wb-w3w3w3w3w3",
                           "wb-w4w4w4w4w4", "wb-w5w5w5w5w5", "wb-w6w6w6w6w6"}) {
        cache.open_workbook(id);
        EXPECT_LE(cache.size(), 3u);
    }
    EXPECT_EQ(cache.resident_ids(), ids({"wb-w6w6w6w6w6", "wb-w5w5w5w5w5", "wb-w4w4w4w4w4"}));
}

TEST_F(WorkbookCacheTest, hits_do_not_reload) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa"});

    auto first = cache.open_workbook("wb-aaaaaaaaaa");
    auto second = cache.open_workbook("wb-aaaaaaaaaa");
    EXPECT_EQ(first, second);
    EXPECT_EQ(loader_.calls(), 1);
    EXPECT_EQ(as_stub(first).contents, "contents of aaaaaaaaaa");
}

TEST_F(WorkbookCacheTest, evicted_handle_stays_valid) {
    auto cache = WorkbookCache{config(1), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa", "bbbbbbbbbb"});

    auto held = cache.open_workbook("wb-aaaaaaaaaa");
    cache.open_workbook("wb-bbbbbbbbbb");

    EXPECT_FALSE(cache.contains("wb-aaaaaaaaaa"));
    EXPECT_EQ(as_stub(held).contents, "contents of aaaaaaaaaa");
}

// -- Statistics ---------------------------------------------------------------

TEST_F(WorkbookCacheTest, hit_rate_is_zero_without_operations) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    EXPECT_EQ(cache.hit_rate(), 0.0);

    auto stats = cache.cache_stats();
    EXPECT_EQ(stats.operations, 0u);
    EXPECT_EQ(stats.size, 0u);
    EXPECT_EQ(stats.capacity, 2u);
}

TEST_F(WorkbookCacheTest, stats_count_hits_and_misses) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa"});

    cache.open_workbook("wb-aaaaaaaaaa");
    for (int i = 0; i < 3; ++i) cache.open_workbook("wb-aaaaaaaaaa");

    auto stats = cache.cache_stats();
    EXPECT_EQ(stats.operations, 4u);
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.75);
    EXPECT_DOUBLE_EQ(cache.hit_rate(), 0.75);
}

// -- Removal ------------------------------------------------------------------

TEST_F(WorkbookCacheTest, evict_by_path_drops_the_entry_once) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa"});
    cache.open_workbook("wb-aaaaaaaaaa");

    auto path = dir_ / "workspace" / "aaaaaaaaaa.xlsx";
    EXPECT_TRUE(cache.evict_by_path(path));
    EXPECT_FALSE(cache.contains("wb-aaaaaaaaaa"));
    EXPECT_FALSE(cache.evict_by_path(path));
    EXPECT_FALSE(cache.evict_by_path(dir_ / "workspace" / "never-seen.xlsx"));

    // The location is still known, so the next open reloads it.
    cache.open_workbook("wb-aaaaaaaaaa");
    EXPECT_EQ(loader_.calls(), 2);
}

TEST_F(WorkbookCacheTest, close_workbook_reports_whether_resident) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa"});
    cache.open_workbook("wb-aaaaaaaaaa");

    EXPECT_TRUE(cache.close_workbook("wb-aaaaaaaaaa"));
    EXPECT_FALSE(cache.close_workbook("wb-aaaaaaaaaa"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(WorkbookCacheTest, forgotten_location_no_longer_resolves) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    auto path = dir_ / "scratch" / "gone.xlsx";
    write_file(path, "gone");
    cache.register_location(WorkbookId{"wb-gonegonego"}, path);

    cache.forget_location(WorkbookId{"wb-gonegonego"});

    EXPECT_THROW(cache.resolve_workbook_path("wb-gonegonego"), EngineError);
    EXPECT_THROW(cache.resolve_workbook_path("gonegonego"), EngineError);
    EXPECT_FALSE(cache.evict_by_path(path));
}

// -- Resolution ---------------------------------------------------------------

TEST_F(WorkbookCacheTest, short_id_alias_resolves_case_insensitively) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"abcdefghij"});

    auto by_alias = cache.open_workbook("ABCDEFGHIJ");
    EXPECT_EQ(as_stub(by_alias).id, WorkbookId{"wb-abcdefghij"});
    EXPECT_EQ(cache.canonicalize("abcdefghij"), WorkbookId{"wb-abcdefghij"});

    cache.open_workbook("wb-abcdefghij");
    EXPECT_EQ(loader_.calls(), 1);
}

TEST_F(WorkbookCacheTest, opening_by_path_derives_a_stable_id) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    auto path = dir_ / "workspace" / "budget.xlsx";
    write_file(path, "budget");

    auto first = cache.open_workbook(path.string());
    const auto& id = as_stub(first).id;
    EXPECT_TRUE(id.str().starts_with("wb-"));
    EXPECT_EQ(id.short_id().size(), 10u);

    auto again = cache.open_workbook(id.str());
    EXPECT_EQ(first, again);
    EXPECT_EQ(cache.resolve_workbook_path(id.short_id()), path);
    EXPECT_EQ(loader_.calls(), 1);
}

TEST_F(WorkbookCacheTest, unknown_ids_are_found_by_scanning_the_workspace) {
    auto path = dir_ / "workspace" / "nested" / "forecast.xlsx";
    write_file(path, "forecast");

    // Learn the derived id from a throwaway cache.
    auto id = WorkbookId{};
    {
        auto first_pass = WorkbookCache{config(1), loader_.loader()};
        id = as_stub(first_pass.open_workbook(path.string())).id;
    }

    auto cache = WorkbookCache{config(2), loader_.loader()};
    auto handle = cache.open_workbook(id.short_id());
    EXPECT_EQ(as_stub(handle).path, path);
    EXPECT_EQ(as_stub(handle).id, id);
}

TEST_F(WorkbookCacheTest, unresolvable_id_is_not_found) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    try {
        cache.open_workbook("wb-zzzzzzzzzz");
        FAIL() << "expected not_found";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_found);
    }
    EXPECT_EQ(loader_.calls(), 0);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.cache_stats().misses, 1u);
}

TEST_F(WorkbookCacheTest, path_resolver_serves_foreign_ids) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    auto work = dir_ / "forks" / "fork-1.xlsx";
    write_file(work, "fork copy");
    cache.set_path_resolver([&](std::string_view id) -> std::optional<std::filesystem::path> {
        if (id == "fork-1") return work;
        return std::nullopt;
    });

    auto handle = cache.open_workbook("fork-1");
    EXPECT_EQ(as_stub(handle).id, WorkbookId{"fork-1"});
    EXPECT_EQ(as_stub(handle).contents, "fork copy");
    EXPECT_TRUE(cache.evict_by_path(work));
}

// -- Concurrency --------------------------------------------------------------

TEST_F(WorkbookCacheTest, concurrent_misses_store_one_entry) {
    auto calls = std::atomic<int>{0};
    auto slow_loader = [&](const WorkbookId& id, const std::filesystem::path& path) -> WorkbookHandle {
        calls.fetch_add(1);
        std::this_thread::sleep_for(20ms);
        return std::make_shared<const StubWorkbook>(id, path, "slow");
    };
    auto cache = WorkbookCache{config(4), slow_loader};
    add_workbooks(cache, {"aaaaaaaaaa"});

    constexpr int readers = 8;
    auto start = std::latch{readers};
    auto handles = std::vector<WorkbookHandle>(readers);
    {
        auto threads = std::vector<std::jthread>{};
        for (int r = 0; r < readers; ++r) {
            threads.emplace_back([&, r] {
                start.arrive_and_wait();
                handles[r] = cache.open_workbook("wb-aaaaaaaaaa");
            });
        }
    }

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_GE(calls.load(), 1);
    for (const auto& h : handles) EXPECT_EQ(h, handles.front());
    EXPECT_EQ(cache.cache_stats().operations, static_cast<std::uint64_t>(readers));
}

TEST_F(WorkbookCacheTest, concurrent_access_never_exceeds_capacity) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa", "bbbbbbbbbb", "cccccccccc", "dddddddddd"});
    const auto names = std::vector<std::string>{
        "wb-aaaaaaaaaa", "wb-bbbbbbbbbb", "wb-cccccccccc", "wb-dddddddddd"};
    {
        auto threads = std::vector<std::jthread>{};
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 100; ++i) {
                    cache.open_workbook(names[static_cast<std::size_t>(t + i) % names.size()]);
                    EXPECT_LE(cache.size(), 2u);
                }
            });
        }
    }
    auto stats = cache.cache_stats();
    EXPECT_EQ(stats.operations, 400u);
    EXPECT_EQ(stats.hits + stats.misses, stats.operations);
}

TEST_F(WorkbookCacheTest, stats_snapshots_stay_consistent_under_load) {
    auto cache = WorkbookCache{config(2), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa", "bbbbbbbbbb", "cccccccccc"});
    const auto names = std::vector<std::string>{"wb-aaaaaaaaaa", "wb-bbbbbbbbbb", "wb-cccccccccc"};
    auto done = std::atomic<bool>{false};
    {
        auto observer = std::jthread{[&] {
            while (!done.load()) {
                auto stats = cache.cache_stats();
                EXPECT_EQ(stats.hits + stats.misses, stats.operations);
                EXPECT_LE(stats.hit_rate(), 1.0);
            }
        }};
        auto threads = std::vector<std::jthread>{};
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 200; ++i) {
                    cache.open_workbook(names[static_cast<std::size_t>(t + i) % names.size()]);
                }
            });
        }
        for (auto& th : threads) th.join();
        done.store(true);
    }
    EXPECT_EQ(cache.cache_stats().operations, 800u);
}

// -- Warming ------------------------------------------------------------------

TEST_F(WorkbookCacheTest, warm_loads_listed_ids_and_reports_failures) {
    auto cache = WorkbookCache{config(4), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa", "bbbbbbbbbb"});
    auto pool = thread_pool{2};

    auto result = cache.warm(
        CacheWarmingConfig{.workbook_ids = {"wb-aaaaaaaaaa", "wb-bbbbbbbbbb", "wb-missingxx"}},
        pool);

    EXPECT_EQ(result.loaded, 2u);
    EXPECT_EQ(result.failed, 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("wb-missingxx"), std::string::npos);
    EXPECT_TRUE(cache.contains("wb-aaaaaaaaaa"));
    EXPECT_TRUE(cache.contains("wb-bbbbbbbbbb"));
}

TEST_F(WorkbookCacheTest, warm_discovers_recent_workbooks) {
    auto cache = WorkbookCache{config(4), loader_.loader()};
    write_file(dir_ / "workspace" / "one.xlsx", "1");
    write_file(dir_ / "workspace" / "two.xlsb", "2");
    write_file(dir_ / "workspace" / "sub" / "three.xls", "3");
    write_file(dir_ / "workspace" / "readme.txt", "not a workbook");
    auto pool = thread_pool{2};

    auto result = cache.warm(CacheWarmingConfig{.max_workbooks = 2}, pool);

    EXPECT_EQ(result.loaded, 2u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(WorkbookCacheTest, warm_does_nothing_when_disabled) {
    auto cache = WorkbookCache{config(4), loader_.loader()};
    add_workbooks(cache, {"aaaaaaaaaa"});
    auto pool = thread_pool{1};

    auto result = cache.warm(
        CacheWarmingConfig{.enabled = false, .workbook_ids = {"wb-aaaaaaaaaa"}}, pool);
    EXPECT_EQ(result.loaded, 0u);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(loader_.calls(), 0);
}
