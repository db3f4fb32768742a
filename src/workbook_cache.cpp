#include <sheetfork-cpp/workbook_cache.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/logging.hpp>

#include "fs_util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <mutex>
#include <system_error>
#include <utility>

namespace sheetfork_cpp {

namespace {

constexpr auto warmup_scan_depth = 3;

auto path_key(const std::filesystem::path& path) -> std::string {
    return path.lexically_normal().string();
}

}  // namespace

WorkbookCache::WorkbookCache(CacheConfig config, WorkbookLoader loader)
    : config_{std::move(config)}, loader_{std::move(loader)} {
    if (config_.capacity == 0) {
        throw make_error(ErrorKind::cache_capacity_misconfigured, "WorkbookCache", "capacity",
                         "cache capacity must be at least 1");
    }
    if (!loader_) {
        throw make_error(ErrorKind::invalid_argument, "WorkbookCache", "loader",
                         "a workbook loader is required");
    }
    entries_.reserve(config_.capacity + 1);
}

// -- Access -------------------------------------------------------------------

auto WorkbookCache::lookup(const WorkbookId& id) -> WorkbookHandle {
    auto lock = std::shared_lock{entries_mutex_};
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    it->second->last_used.store(next_tick(), std::memory_order_relaxed);
    hits_.fetch_add(1, std::memory_order_relaxed);
    SHEETFORK_LOG_DEBUG("cache hit workbook_id={}", id.str());
    return it->second->handle;
}

auto WorkbookCache::open_workbook(std::string_view id_or_alias) -> WorkbookHandle {
    if (auto handle = lookup(canonicalize(id_or_alias))) return handle;

    misses_.fetch_add(1, std::memory_order_relaxed);
    SHEETFORK_LOG_DEBUG("cache miss workbook_id={}", id_or_alias);

    // No lock is held while resolving and loading.
    auto location = locate(id_or_alias);
    auto handle = loader_(location.id, location.path);
    if (!handle) {
        throw io_failure("open_workbook", location.path.string(), "loader returned no workbook");
    }

    auto lock = std::unique_lock{entries_mutex_};
    if (auto it = entries_.find(location.id); it != entries_.end()) {
        SHEETFORK_LOG_DEBUG("cache race: reusing entry loaded concurrently workbook_id={}",
                            location.id.str());
        it->second->last_used.store(next_tick(), std::memory_order_relaxed);
        return it->second->handle;
    }
    if (entries_.size() >= config_.capacity) evict_lru_locked();
    entries_.emplace(location.id,
                     std::make_unique<CacheEntry>(location.id, handle, location.path, next_tick()));
    SHEETFORK_LOG_DEBUG("workbook cached workbook_id={} path={}",
                        location.id.str(), location.path.string());
    return handle;
}

void WorkbookCache::evict_lru_locked() {
    auto victim = std::ranges::min_element(entries_, {}, [](const auto& kv) {
        return kv.second->last_used.load(std::memory_order_relaxed);
    });
    if (victim == entries_.end()) return;
    SHEETFORK_LOG_DEBUG("cache evict workbook_id={}", victim->first.str());
    entries_.erase(victim);
}

auto WorkbookCache::close_workbook(std::string_view id_or_alias) -> bool {
    auto id = canonicalize(id_or_alias);
    auto lock = std::unique_lock{entries_mutex_};
    auto removed = entries_.erase(id) > 0;
    if (removed) SHEETFORK_LOG_DEBUG("workbook closed workbook_id={}", id.str());
    return removed;
}

auto WorkbookCache::evict_by_path(const std::filesystem::path& path) -> bool {
    auto id = std::optional<WorkbookId>{};
    {
        auto lock = std::shared_lock{index_mutex_};
        if (auto it = path_to_id_.find(path_key(path)); it != path_to_id_.end()) id = it->second;
    }
    if (!id) return false;

    auto lock = std::unique_lock{entries_mutex_};
    auto removed = entries_.erase(*id) > 0;
    if (removed) {
        SHEETFORK_LOG_DEBUG("evicted by path workbook_id={} path={}", id->str(), path.string());
    }
    return removed;
}

// -- Resolution ---------------------------------------------------------------

auto WorkbookCache::canonicalize(std::string_view id_or_alias) const -> WorkbookId {
    if (auto found = find_indexed(id_or_alias)) return found->id;
    return WorkbookId{std::string{id_or_alias}};
}

auto WorkbookCache::find_indexed(std::string_view id_or_alias) const -> std::optional<Location> {
    auto key = std::string{id_or_alias};
    auto lock = std::shared_lock{index_mutex_};

    auto at = [&](const WorkbookId& id) -> std::optional<Location> {
        auto it = id_to_path_.find(id);
        if (it == id_to_path_.end()) return std::nullopt;
        return Location{id, it->second};
    };

    if (auto found = at(WorkbookId{key})) return found;
    if (auto it = alias_to_id_.find(key); it != alias_to_id_.end()) return at(it->second);
    if (auto it = alias_to_id_.find(detail::ascii_lower(key)); it != alias_to_id_.end()) {
        return at(it->second);
    }
    if (auto it = path_to_id_.find(path_key(key)); it != path_to_id_.end()) return at(it->second);
    return std::nullopt;
}

auto WorkbookCache::locate(std::string_view id_or_path) -> Location {
    constexpr auto op = std::string_view{"resolve_workbook_path"};

    auto resolver = PathResolver{};
    {
        auto lock = std::shared_lock{index_mutex_};
        resolver = path_resolver_;
    }
    if (resolver) {
        if (auto path = resolver(id_or_path)) {
            SHEETFORK_LOG_DEBUG("resolved through path resolver id={} path={}",
                                id_or_path, path->string());
            auto location = Location{WorkbookId{std::string{id_or_path}}, *path};
            register_location(location.id, location.path);
            return location;
        }
    }

    if (auto found = find_indexed(id_or_path)) return *found;

    auto candidate = std::filesystem::path{std::string{id_or_path}};
    auto ec = std::error_code{};
    if (has_supported_extension(candidate, config_.supported_extensions) &&
        std::filesystem::is_regular_file(candidate, ec)) {
        auto id = detail::derive_workbook_id(candidate);
        if (!id.empty()) {
            register_location(id, candidate);
            return Location{std::move(id), candidate};
        }
    }

    SHEETFORK_LOG_DEBUG("scanning workspace for workbook id={}", id_or_path);
    if (auto found = scan_workspace(id_or_path)) {
        register_location(found->id, found->path);
        return *found;
    }
    throw not_found(op, id_or_path);
}

auto WorkbookCache::resolve_workbook_path(std::string_view id_or_path) -> std::filesystem::path {
    return locate(id_or_path).path;
}

auto WorkbookCache::scan_workspace(std::string_view candidate) const -> std::optional<Location> {
    if (config_.workspace_root.empty()) return std::nullopt;

    auto wanted = detail::ascii_lower(candidate);
    auto ec = std::error_code{};
    auto it = std::filesystem::recursive_directory_iterator{
        config_.workspace_root, std::filesystem::directory_options::skip_permission_denied, ec};
    if (ec) {
        SHEETFORK_LOG_WARN("workspace scan failed root={}: {}",
                           config_.workspace_root.string(), ec.message());
        return std::nullopt;
    }
    for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        const auto& path = it->path();
        if (!has_supported_extension(path, config_.supported_extensions)) continue;
        auto id = detail::derive_workbook_id(path);
        if (id.empty()) continue;
        if (wanted == id.str() || wanted == id.short_id()) return Location{std::move(id), path};
    }
    return std::nullopt;
}

void WorkbookCache::register_location(const WorkbookId& id, const std::filesystem::path& path) {
    auto lock = std::unique_lock{index_mutex_};
    id_to_path_.insert_or_assign(id, path);
    path_to_id_.insert_or_assign(path_key(path), id);
    auto short_id = id.short_id();
    if (short_id != id.str()) alias_to_id_.insert_or_assign(detail::ascii_lower(short_id), id);
    SHEETFORK_LOG_DEBUG("registered workbook location workbook_id={} path={}",
                        id.str(), path.string());
}

void WorkbookCache::forget_location(const WorkbookId& id) {
    auto lock = std::unique_lock{index_mutex_};
    auto it = id_to_path_.find(id);
    if (it == id_to_path_.end()) return;
    if (auto p = path_to_id_.find(path_key(it->second)); p != path_to_id_.end() && p->second == id) {
        path_to_id_.erase(p);
    }
    std::erase_if(alias_to_id_, [&](const auto& kv) { return kv.second == id; });
    id_to_path_.erase(it);
    SHEETFORK_LOG_DEBUG("forgot workbook location workbook_id={}", id.str());
}

void WorkbookCache::set_path_resolver(PathResolver resolver) {
    auto lock = std::unique_lock{index_mutex_};
    path_resolver_ = std::move(resolver);
}

// -- Introspection ------------------------------------------------------------

auto WorkbookCache::contains(std::string_view id_or_alias) const -> bool {
    auto id = canonicalize(id_or_alias);
    auto lock = std::shared_lock{entries_mutex_};
    return entries_.contains(id);
}

auto WorkbookCache::resident_ids() const -> std::vector<WorkbookId> {
    auto ranked = std::vector<std::pair<std::uint64_t, WorkbookId>>{};
    {
        auto lock = std::shared_lock{entries_mutex_};
        ranked.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            ranked.emplace_back(entry->last_used.load(std::memory_order_relaxed), id);
        }
    }
    std::ranges::sort(ranked, std::ranges::greater{}, &std::pair<std::uint64_t, WorkbookId>::first);
    auto ids = std::vector<WorkbookId>{};
    ids.reserve(ranked.size());
    for (auto& [tick, id] : ranked) ids.push_back(std::move(id));
    return ids;
}

auto WorkbookCache::size() const -> std::size_t {
    auto lock = std::shared_lock{entries_mutex_};
    return entries_.size();
}

auto WorkbookCache::cache_stats() const -> CacheStats {
    auto stats = CacheStats{
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .capacity = config_.capacity,
    };
    // Derived, so a snapshot taken mid-update never has hits > operations.
    stats.operations = stats.hits + stats.misses;
    stats.size = size();
    return stats;
}

auto WorkbookCache::hit_rate() const -> double {
    return cache_stats().hit_rate();
}

// -- Warming ------------------------------------------------------------------

auto WorkbookCache::warm(const CacheWarmingConfig& warming, thread_pool& pool)
    -> CacheWarmingResult {
    if (!warming.enabled) {
        SHEETFORK_LOG_DEBUG("cache warming disabled");
        return {};
    }
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + warming.timeout;

    auto ids = warming.workbook_ids.empty()
        ? discover_warmup_candidates(warming.max_workbooks)
        : warming.workbook_ids;
    if (ids.size() > warming.max_workbooks) ids.resize(warming.max_workbooks);
    SHEETFORK_LOG_INFO("cache warming started candidates={}", ids.size());
    if (ids.empty()) return {};

    auto loaded = std::atomic<std::size_t>{0};
    auto failed = std::atomic<std::size_t>{0};
    auto errors = std::vector<std::string>{};
    auto errors_mutex = std::mutex{};

    pool.parallelize_loop(std::size_t{0}, ids.size(), [&](std::size_t begin, std::size_t end) {
        for (auto i = begin; i < end; ++i) {
            if (std::chrono::steady_clock::now() >= deadline) return;
            try {
                open_workbook(ids[i]);
                loaded.fetch_add(1, std::memory_order_relaxed);
            } catch (const std::exception& e) {
                failed.fetch_add(1, std::memory_order_relaxed);
                SHEETFORK_LOG_WARN("failed to warm workbook id={}: {}", ids[i], e.what());
                auto lock = std::scoped_lock{errors_mutex};
                errors.push_back(fmt::format("{}: {}", ids[i], e.what()));
            }
        }
    }).wait();

    auto result = CacheWarmingResult{
        .loaded = loaded.load(),
        .failed = failed.load(),
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start),
        .errors = std::move(errors),
    };
    SHEETFORK_LOG_INFO("cache warming completed loaded={} failed={} duration={}ms",
                       result.loaded, result.failed, result.duration.count());
    return result;
}

auto WorkbookCache::discover_warmup_candidates(std::size_t max_count) -> std::vector<std::string> {
    if (config_.workspace_root.empty() || max_count == 0) return {};

    struct Candidate {
        std::filesystem::path path;
        std::filesystem::file_time_type modified;
    };
    auto candidates = std::vector<Candidate>{};

    auto ec = std::error_code{};
    auto it = std::filesystem::recursive_directory_iterator{
        config_.workspace_root, std::filesystem::directory_options::skip_permission_denied, ec};
    if (ec) return {};
    for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) break;
        if (it.depth() + 1 >= warmup_scan_depth) it.disable_recursion_pending();
        if (!it->is_regular_file(ec)) continue;
        if (!has_supported_extension(it->path(), config_.supported_extensions)) continue;
        auto modified = it->last_write_time(ec);
        if (ec) continue;
        candidates.push_back(Candidate{it->path(), modified});
    }

    std::ranges::sort(candidates, std::ranges::greater{}, &Candidate::modified);
    if (candidates.size() > max_count) candidates.resize(max_count);

    auto ids = std::vector<std::string>{};
    for (const auto& candidate : candidates) {
        auto id = detail::derive_workbook_id(candidate.path);
        if (id.empty()) continue;
        register_location(id, candidate.path);
        ids.push_back(id.str());
    }
    return ids;
}

}  // namespace sheetfork_cpp
