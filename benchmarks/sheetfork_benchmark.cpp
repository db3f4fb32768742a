// sheetfork-cpp benchmarks -- measures throughput of the hot paths.

#include <sheetfork-cpp/sheetfork.hpp>

#include <benchmark/benchmark.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

using namespace sheetfork_cpp;

namespace {

struct BenchWorkbook : ParsedWorkbook {
    explicit BenchWorkbook(std::filesystem::path p) : path{std::move(p)} {}
    std::filesystem::path path;
};

auto bench_loader() -> WorkbookLoader {
    return [](const WorkbookId&, const std::filesystem::path& path) -> WorkbookHandle {
        return std::make_shared<const BenchWorkbook>(path);
    };
}

// Temp directory with a single workbook, removed at exit.
class BenchDir {
public:
    BenchDir() {
        set_log_level("warn");
        auto rng = std::random_device{};
        root_ = std::filesystem::temp_directory_path() /
                ("sheetfork-bench-" + std::to_string(rng()));
        std::filesystem::create_directories(root_ / "models");
        auto out = std::ofstream{workbook(), std::ios::binary};
        out << std::string(64 * 1024, 'x');
    }
    ~BenchDir() {
        auto ec = std::error_code{};
        std::filesystem::remove_all(root_, ec);
    }

    auto root() const -> const std::filesystem::path& { return root_; }
    auto workbook() const -> std::filesystem::path { return root_ / "models" / "bench.xlsx"; }

    auto fork_config() const -> ForkConfig {
        return ForkConfig{
            .fork_dir = root_ / "forks",
            .workspace_root = root_ / "models",
            .max_forks = 1000,
        };
    }

private:
    std::filesystem::path root_;
};

auto bench_dir() -> BenchDir& {
    static auto dir = BenchDir{};
    return dir;
}

auto register_ids(WorkbookCache& cache, std::size_t n) -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    for (std::size_t i = 0; i < n; ++i) {
        auto id = "wb-" + std::string(10 - std::to_string(i).size(), 'a') + std::to_string(i);
        cache.register_location(WorkbookId{id}, bench_dir().workbook());
        ids.push_back(id);
    }
    return ids;
}

}  // namespace

// =============================================================================
// Workbook cache
// =============================================================================

static void bm_cache_hit(benchmark::State& state) {
    auto cache = WorkbookCache{CacheConfig{.capacity = 8}, bench_loader()};
    auto ids = register_ids(cache, 1);
    cache.open_workbook(ids[0]);

    for (auto _ : state) {
        auto handle = cache.open_workbook(ids[0]);
        benchmark::DoNotOptimize(handle);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_cache_hit);

static void bm_cache_hit_contended(benchmark::State& state) {
    static auto cache = std::unique_ptr<WorkbookCache>{};
    static auto ids = std::vector<std::string>{};
    if (state.thread_index() == 0) {
        cache = std::make_unique<WorkbookCache>(CacheConfig{.capacity = 8}, bench_loader());
        ids = register_ids(*cache, 4);
        for (const auto& id : ids) cache->open_workbook(id);
    }
    auto i = static_cast<std::size_t>(state.thread_index());
    for (auto _ : state) {
        auto handle = cache->open_workbook(ids[i++ % ids.size()]);
        benchmark::DoNotOptimize(handle);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_cache_hit_contended)->ThreadRange(1, 8);

static void bm_cache_churn(benchmark::State& state) {
    const auto working_set = static_cast<std::size_t>(state.range(0));
    auto cache = WorkbookCache{CacheConfig{.capacity = 4}, bench_loader()};
    auto ids = register_ids(cache, working_set);
    std::size_t i = 0;
    for (auto _ : state) {
        auto handle = cache.open_workbook(ids[i++ % ids.size()]);
        benchmark::DoNotOptimize(handle);
    }
    state.counters["hit_rate"] = cache.hit_rate();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_cache_churn)->Arg(4)->Arg(8)->Arg(64);

// =============================================================================
// Fork registry
// =============================================================================

static void bm_versioned_mutation(benchmark::State& state) {
    auto registry = ForkRegistry{bench_dir().fork_config()};
    auto id = registry.create_fork(WorkbookId{"wb-benchbench"}, bench_dir().workbook());
    auto version = Version{0};
    for (auto _ : state) {
        version = registry.with_fork_mut_versioned(id, version, [](ForkTransaction& tx) {
            tx.record_edit("Sheet1", "A1", "1");
            return tx.base_version() + 1;
        });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_versioned_mutation);

static void bm_get_version(benchmark::State& state) {
    auto registry = ForkRegistry{bench_dir().fork_config()};
    auto id = registry.create_fork(WorkbookId{"wb-benchbench"}, bench_dir().workbook());
    for (auto _ : state) {
        benchmark::DoNotOptimize(registry.get_version(id));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_version);

static void bm_create_and_discard(benchmark::State& state) {
    auto registry = ForkRegistry{bench_dir().fork_config()};
    for (auto _ : state) {
        auto id = registry.create_fork(WorkbookId{"wb-benchbench"}, bench_dir().workbook());
        registry.discard_fork(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_create_and_discard);

static void bm_recalc_lock_cycle(benchmark::State& state) {
    auto registry = ForkRegistry{bench_dir().fork_config()};
    auto id = registry.create_fork(WorkbookId{"wb-benchbench"}, bench_dir().workbook());
    for (auto _ : state) {
        {
            auto lock = registry.acquire_recalc_lock(id);
            auto held = std::scoped_lock{*lock};
        }
        registry.release_recalc_lock(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_recalc_lock_cycle);
