/// @file workspace.hpp
/// @brief Workspace -- owns the workbook cache and the fork registry of
/// one server instance.

#pragma once

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/fork_registry.hpp>
#include <sheetfork-cpp/recalc.hpp>
#include <sheetfork-cpp/source_storage.hpp>
#include <sheetfork-cpp/types.hpp>
#include <sheetfork-cpp/workbook_cache.hpp>

#include <concepts>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sheetfork_cpp {

/// Application state handed to tool handlers.
///
/// Fork ids are accepted wherever a workbook id is: the cache resolves
/// them to the fork's working copy before consulting its own index.
///
/// @code
/// auto ws = Workspace{config, load_xlsx};
/// auto fork = ws.create_fork("wb-abcdefghij");
/// auto view = ws.open_workbook(fork.str());   // parsed working copy
/// ws.save_fork(fork, "/data/model-v2.xlsx");
/// @endcode
class Workspace {
public:
    /// Applies config.log_level and propagates workspace_root into the
    /// cache and fork sections.
    /// @throws EngineError (cache_capacity_misconfigured, io_failure)
    Workspace(EngineConfig config, WorkbookLoader loader,
              std::shared_ptr<SourceStorage> storage = std::make_shared<FilesystemStorage>());

    Workspace(const Workspace&) = delete;
    auto operator=(const Workspace&) -> Workspace& = delete;

    auto config() const -> const EngineConfig& { return config_; }
    auto cache() -> WorkbookCache& { return cache_; }
    auto registry() -> ForkRegistry& { return registry_; }

    /// Open a workbook (or a fork's working copy) through the cache.
    auto open_workbook(std::string_view id_or_alias) -> WorkbookHandle;

    /// Resolve a workbook id, alias or path and fork it.
    auto create_fork(std::string_view workbook_id) -> ForkId;

    /// Save a fork and drop any cached copy of the target and the fork.
    void save_fork(const ForkId& fork_id, const std::filesystem::path& target_path,
                   bool allow_overwrite = false);

    /// Discard a fork and drop any cached copy of it.
    void discard_fork(const ForkId& fork_id);

    /// Versioned edit of a fork. Once `fn` commits, the fork's cached view
    /// is dropped so the next open_workbook() parses the new working copy.
    /// @throws EngineError: not_found, version_conflict, lock_timeout.
    template <typename Fn>
        requires std::invocable<Fn, ForkTransaction&>
    auto with_fork_mut_versioned(const ForkId& fork_id, Version expected, Fn&& fn)
        -> std::invoke_result_t<Fn, ForkTransaction&>;

    auto checkpoint_fork(const ForkId& fork_id, std::optional<std::string> label = std::nullopt)
        -> CheckpointInfo;

    /// Restore a checkpoint, then drop the fork's cached view.
    auto restore_checkpoint(const ForkId& fork_id, Version expected,
                            std::string_view checkpoint_id) -> Version;

    /// Recalculate a fork, then drop its stale cached view.
    auto recalculate(const ForkId& fork_id, RecalcBackend& backend) -> RecalcResult;

    auto cache_stats() const -> CacheStats { return cache_.cache_stats(); }

private:
    /// Drop cached views of a fork by id and by working-copy path.
    void evict_fork_views(const ForkId& fork_id, const std::optional<std::filesystem::path>& work_path);

    EngineConfig config_;
    WorkbookCache cache_;
    ForkRegistry registry_;
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, ForkTransaction&>
auto Workspace::with_fork_mut_versioned(const ForkId& fork_id, Version expected, Fn&& fn)
    -> std::invoke_result_t<Fn, ForkTransaction&> {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, ForkTransaction&>>) {
        registry_.with_fork_mut_versioned(fork_id, expected, std::forward<Fn>(fn));
        cache_.close_workbook(fork_id.str());
    } else {
        auto result = registry_.with_fork_mut_versioned(fork_id, expected, std::forward<Fn>(fn));
        cache_.close_workbook(fork_id.str());
        return result;
    }
}

}  // namespace sheetfork_cpp
