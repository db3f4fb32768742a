/// @file config.hpp
/// @brief Configuration records for the fork registry, the workbook cache
/// and the engine as a whole.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sheetfork_cpp {

/// Extensions (lower case, no dot) accepted as workbooks by default.
inline const auto default_extensions = std::vector<std::string>{"xlsx", "xls", "xlsb"};

/// Settings for ForkRegistry.
struct ForkConfig {
    /// Directory holding fork working copies and checkpoint snapshots.
    std::filesystem::path fork_dir{"/tmp/sheetfork-forks"};
    /// Source files must live under this root. Empty = no restriction.
    std::filesystem::path workspace_root{};
    /// Forks older than this are discarded by evict_expired().
    std::chrono::seconds ttl{3600};
    std::size_t max_forks{10};
    std::uintmax_t max_file_size{std::uintmax_t{100} * 1024 * 1024};
    std::size_t max_checkpoints_per_fork{10};
    std::chrono::seconds cleanup_interval{60};
    std::size_t max_concurrent_recalcs{2};
    /// Longest wait for a fork's exclusive intent before lock_timeout.
    std::chrono::milliseconds lock_timeout{30'000};
    std::vector<std::string> supported_extensions{default_extensions};

    auto operator==(const ForkConfig&) const -> bool = default;
};

/// Settings for WorkbookCache.
struct CacheConfig {
    std::size_t capacity{5};
    /// Root scanned when an id is not in the index. Empty = no scanning.
    std::filesystem::path workspace_root{};
    std::vector<std::string> supported_extensions{default_extensions};

    auto operator==(const CacheConfig&) const -> bool = default;
};

/// Settings for WorkbookCache::warm().
struct CacheWarmingConfig {
    bool enabled{true};
    std::size_t max_workbooks{5};
    std::chrono::seconds timeout{30};
    /// Explicit ids to warm; empty = most recently modified workbooks.
    std::vector<std::string> workbook_ids{};

    auto operator==(const CacheWarmingConfig&) const -> bool = default;
};

/// Top-level configuration consumed by Workspace.
struct EngineConfig {
    std::filesystem::path workspace_root{"."};
    CacheConfig cache{};
    ForkConfig forks{};
    CacheWarmingConfig warming{};
    /// spdlog level name: trace, debug, info, warn, err, critical, off.
    std::string log_level{"info"};

    auto operator==(const EngineConfig&) const -> bool = default;

    /// Copy workspace_root into the cache and fork sections where unset.
    void propagate_workspace_root();
};

/// True if `path` has one of `extensions` (compared case-insensitively).
auto has_supported_extension(const std::filesystem::path& path,
                             const std::vector<std::string>& extensions) -> bool;

/// Load an EngineConfig from a JSON file.
/// @throws EngineError (io_failure) if the file cannot be read,
///   (invalid_argument) if it is not valid configuration JSON.
auto load_config(const std::filesystem::path& path) -> EngineConfig;

/// Parse an EngineConfig from JSON text. Missing keys keep their defaults.
/// @throws EngineError (invalid_argument) on malformed input.
auto parse_config(std::string_view json_text) -> EngineConfig;

}  // namespace sheetfork_cpp
