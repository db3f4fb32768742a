/// @file workbook_cache.hpp
/// @brief WorkbookCache -- bounded LRU of parsed workbook handles with a
/// path and alias index, plus CacheStats.

#pragma once

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/thread_pool.hpp>
#include <sheetfork-cpp/types.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetfork_cpp {

/// Base class for whatever the external parser produces. The cache never
/// looks inside.
class ParsedWorkbook {
public:
    virtual ~ParsedWorkbook() = default;
};

/// Shared, immutable handle to a parsed workbook. A handle stays valid
/// after its entry is evicted until the last holder drops it.
using WorkbookHandle = std::shared_ptr<const ParsedWorkbook>;

/// Parses the workbook at a path. Called with no cache lock held.
using WorkbookLoader =
    std::function<WorkbookHandle(const WorkbookId&, const std::filesystem::path&)>;

/// Resolves ids the cache does not own (e.g. fork ids) to a path.
using PathResolver =
    std::function<std::optional<std::filesystem::path>(std::string_view)>;

/// Snapshot of cache health.
struct CacheStats {
    std::uint64_t operations{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::size_t size{0};
    std::size_t capacity{0};

    /// hits / operations, or 0.0 when there were no operations.
    auto hit_rate() const -> double {
        if (operations == 0) return 0.0;
        return static_cast<double>(hits) / static_cast<double>(operations);
    }

    auto operator==(const CacheStats&) const -> bool = default;
};

/// Outcome of WorkbookCache::warm().
struct CacheWarmingResult {
    std::size_t loaded{0};
    std::size_t failed{0};
    std::chrono::milliseconds duration{0};
    std::vector<std::string> errors{};
};

/// A bounded LRU cache from WorkbookId to parsed workbook.
///
/// Hits are served under a shared lock: recency is promoted and the
/// counters bumped with atomics, so concurrent hits never block each
/// other. A miss releases every lock, resolves the path and loads the
/// workbook, then takes the exclusive lock only to insert. If another
/// thread inserted the same id meanwhile, its entry is reused and the
/// redundant load is discarded. The least recently used entry is evicted
/// first when the cache is full, so size never exceeds capacity.
///
/// The id index (id -> path, path -> id, alias -> id) has its own lock.
/// The two locks are never held together, and neither is held across I/O.
///
/// @code
/// auto cache = WorkbookCache{CacheConfig{.capacity = 8}, load_xlsx};
/// auto wb = cache.open_workbook("wb-abcdefghij");
/// auto stats = cache.cache_stats();
/// @endcode
class WorkbookCache {
public:
    /// @throws EngineError (cache_capacity_misconfigured) if capacity is 0.
    WorkbookCache(CacheConfig config, WorkbookLoader loader);

    WorkbookCache(const WorkbookCache&) = delete;
    auto operator=(const WorkbookCache&) -> WorkbookCache& = delete;

    auto config() const -> const CacheConfig& { return config_; }

    // -- Access ---------------------------------------------------------------

    /// Return the cached workbook for an id, short id alias or path,
    /// loading it on a miss.
    /// @throws EngineError (not_found) if it cannot be resolved; whatever
    ///   the loader throws.
    auto open_workbook(std::string_view id_or_alias) -> WorkbookHandle;

    /// Drop an entry. @return true if it was resident.
    auto close_workbook(std::string_view id_or_alias) -> bool;

    /// Drop the entry loaded from `path`, if any. Safe to call when the
    /// entry is already gone. @return true if an entry was removed.
    auto evict_by_path(const std::filesystem::path& path) -> bool;

    // -- Resolution -----------------------------------------------------------

    /// Map an id, alias or path to the workbook's file location.
    /// @throws EngineError (not_found)
    auto resolve_workbook_path(std::string_view id_or_path) -> std::filesystem::path;

    /// Map an alias or indexed path to its canonical id. Unknown input is
    /// returned unchanged.
    auto canonicalize(std::string_view id_or_alias) const -> WorkbookId;

    /// Record where a workbook lives and register its short id alias.
    void register_location(const WorkbookId& id, const std::filesystem::path& path);

    /// Remove a location and its aliases from the index, e.g. once the
    /// file it names has been deleted. Does not touch resident entries.
    void forget_location(const WorkbookId& id);

    /// Consulted before the index, with no lock held.
    void set_path_resolver(PathResolver resolver);

    // -- Introspection --------------------------------------------------------

    auto contains(std::string_view id_or_alias) const -> bool;

    /// Resident ids, most recently used first.
    auto resident_ids() const -> std::vector<WorkbookId>;

    auto size() const -> std::size_t;
    auto capacity() const -> std::size_t { return config_.capacity; }

    auto cache_stats() const -> CacheStats;
    auto hit_rate() const -> double;

    // -- Warming --------------------------------------------------------------

    /// Pre-load the configured ids, or the most recently modified workbooks
    /// under the workspace root, in parallel on `pool`. Stops starting new
    /// loads once the timeout passes. Failures are collected, not thrown.
    auto warm(const CacheWarmingConfig& warming, thread_pool& pool) -> CacheWarmingResult;

private:
    struct CacheEntry {
        CacheEntry(WorkbookId id, WorkbookHandle handle, std::filesystem::path path,
                   std::uint64_t tick)
            : id{std::move(id)}, handle{std::move(handle)}, path{std::move(path)}, last_used{tick} {}

        const WorkbookId id;
        const WorkbookHandle handle;
        const std::filesystem::path path;
        std::atomic<std::uint64_t> last_used;
    };

    struct Location {
        WorkbookId id;
        std::filesystem::path path;
    };

    /// Hit path: shared lock, atomic recency and counters.
    auto lookup(const WorkbookId& id) -> WorkbookHandle;

    /// Find an id's location, scanning the workspace root if needed.
    auto locate(std::string_view id_or_path) -> Location;
    auto find_indexed(std::string_view id_or_alias) const -> std::optional<Location>;
    auto scan_workspace(std::string_view candidate) const -> std::optional<Location>;
    auto discover_warmup_candidates(std::size_t max_count) -> std::vector<std::string>;

    /// Remove the least recently used entry. Requires the exclusive lock.
    void evict_lru_locked();

    auto next_tick() noexcept -> std::uint64_t {
        return tick_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    CacheConfig config_;
    WorkbookLoader loader_;

    mutable std::shared_mutex entries_mutex_;
    std::unordered_map<WorkbookId, std::unique_ptr<CacheEntry>> entries_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<WorkbookId, std::filesystem::path> id_to_path_;
    std::unordered_map<std::string, WorkbookId> path_to_id_;
    std::unordered_map<std::string, WorkbookId> alias_to_id_;
    PathResolver path_resolver_;

    std::atomic<std::uint64_t> tick_{0};
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
};

}  // namespace sheetfork_cpp
