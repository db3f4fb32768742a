/// @file fork_registry.hpp
/// @brief ForkRegistry -- the control plane owning every live fork.

#pragma once

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/fork_context.hpp>
#include <sheetfork-cpp/fork_transaction.hpp>
#include <sheetfork-cpp/recalc.hpp>
#include <sheetfork-cpp/recalc_lock_table.hpp>
#include <sheetfork-cpp/source_storage.hpp>
#include <sheetfork-cpp/types.hpp>

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sheetfork_cpp {

/// Owns the fork_id -> ForkContext mapping and the recalc lock table.
///
/// One registry is constructed per server (or per test) and passed by
/// reference to every caller; it is not a global. All operations are safe
/// to call concurrently.
///
/// Locking:
/// - The id map is guarded by a shared_mutex. Lookups take it shared;
///   insertion and removal take it exclusively, only around the map
///   mutation and never across file I/O.
/// - Each fork has an exclusive-intent lock, held from version validation
///   to commit. Different forks never contend, and readers of a fork
///   (version, path, info) never take it.
/// - Lock order is intent, then registry, then lock table.
///
/// @code
/// auto registry = ForkRegistry{ForkConfig{.fork_dir = "/var/tmp/forks"}};
/// auto id = registry.create_fork(workbook_id, "/data/model.xlsx");
/// registry.with_fork_mut_versioned(id, 0, [](ForkTransaction& tx) {
///     tx.record_edit("Inputs", "B2", "1200");
/// });
/// registry.save_fork(id, "/data/model-v2.xlsx");
/// @endcode
class ForkRegistry {
    friend class ForkCreationGuard;

public:
    /// Construct a registry, creating `fork_dir` and its checkpoint directory.
    /// @throws EngineError (io_failure) if the directories cannot be created.
    explicit ForkRegistry(ForkConfig config,
                          std::shared_ptr<SourceStorage> storage = std::make_shared<FilesystemStorage>());

    /// Stops the cleanup task. Working files of live forks are left on disk.
    ~ForkRegistry();

    ForkRegistry(const ForkRegistry&) = delete;
    auto operator=(const ForkRegistry&) -> ForkRegistry& = delete;
    ForkRegistry(ForkRegistry&&) = delete;
    auto operator=(ForkRegistry&&) -> ForkRegistry& = delete;

    auto config() const -> const ForkConfig& { return config_; }

    // -- Creation -------------------------------------------------------------

    /// Create a fork of the workbook stored at `base_path`.
    ///
    /// The working copy is written to `fork_dir/<fork_id>.<ext>`. The whole
    /// sequence runs under a ForkCreationGuard: a failure after the id is
    /// allocated leaves no registry entry, lock entry or file behind.
    /// @throws EngineError: limit_exceeded, invalid_argument, not_found,
    ///   io_failure.
    auto create_fork(const WorkbookId& workbook_id, const std::filesystem::path& base_path) -> ForkId;

    // -- Reading --------------------------------------------------------------

    /// Working-copy path of a fork.
    /// @throws EngineError (not_found)
    auto get_fork_path(const ForkId& fork_id) const -> std::filesystem::path;

    /// Working-copy path of a fork, or nullopt.
    auto find_fork_path(const ForkId& fork_id) const -> std::optional<std::filesystem::path>;

    /// Snapshot of one fork.
    /// @throws EngineError (not_found)
    auto get_fork(const ForkId& fork_id) const -> ForkInfo;

    /// Current version of a fork.
    /// @throws EngineError (not_found)
    auto get_version(const ForkId& fork_id) const -> Version;

    /// Snapshot of every live fork at call time, oldest first.
    auto list_forks() const -> std::vector<ForkInfo>;

    auto fork_count() const -> std::size_t;
    auto contains(const ForkId& fork_id) const -> bool;

    // -- Mutation -------------------------------------------------------------

    /// Run `fn` against a fork if its version still equals `expected`.
    ///
    /// On a version mismatch, throws EngineError (version_conflict)
    /// carrying the current version; `fn` is not invoked. Otherwise `fn`
    /// runs while the fork's exclusive intent is held; if it returns, its
    /// staged edits are committed and the version is incremented exactly
    /// once. If it throws, nothing is committed and the exception
    /// propagates.
    ///
    /// @code
    /// auto v = registry.get_version(id);
    /// auto cells = registry.with_fork_mut_versioned(id, v, [](ForkTransaction& tx) {
    ///     tx.record_edit("Data", "A1", "=SUM(B1:B9)", true);
    ///     return tx.pending_edits().size();
    /// });
    /// @endcode
    /// @throws EngineError: not_found, version_conflict, lock_timeout.
    template <typename Fn>
        requires std::invocable<Fn, ForkTransaction&>
    auto with_fork_mut_versioned(const ForkId& fork_id, Version expected, Fn&& fn)
        -> std::invoke_result_t<Fn, ForkTransaction&>;

    // -- Removal --------------------------------------------------------------

    /// Remove a fork: registry entry, lock entry, working copy, snapshots.
    /// @throws EngineError (not_found) if absent, (io_failure) if the
    ///   working copy could not be removed.
    void delete_fork(const ForkId& fork_id);

    /// Terminal: abandon a fork's changes. Same as delete_fork().
    void discard_fork(const ForkId& fork_id);

    /// Terminal: promote the working copy to `target_path`, then remove the
    /// fork. On failure the target is untouched and the fork stays live.
    /// @throws EngineError: not_found, invalid_argument, base_modified,
    ///   io_failure, lock_timeout.
    void save_fork(const ForkId& fork_id, const std::filesystem::path& target_path,
                   bool allow_overwrite = false);

    /// Remove every fork older than the configured ttl. Forks with a
    /// mutation in progress are skipped until the next sweep.
    /// @return the number of forks removed.
    auto evict_expired() -> std::size_t;

    // -- Checkpoints ----------------------------------------------------------

    /// Snapshot the working copy. Does not change the version. The oldest
    /// checkpoints beyond max_checkpoints_per_fork are pruned.
    /// @throws EngineError: not_found, io_failure, lock_timeout.
    auto checkpoint_fork(const ForkId& fork_id, std::optional<std::string> label = std::nullopt)
        -> CheckpointInfo;

    /// Checkpoints of a fork, oldest first.
    /// @throws EngineError (not_found)
    auto list_checkpoints(const ForkId& fork_id) const -> std::vector<CheckpointInfo>;

    /// Replace the working copy with a checkpoint. A versioned mutation.
    /// @throws EngineError: not_found, version_conflict, checkpoint_invalid,
    ///   io_failure, lock_timeout.
    auto restore_checkpoint(const ForkId& fork_id, Version expected,
                            std::string_view checkpoint_id) -> Version;

    /// Remove one checkpoint and its snapshot.
    /// @throws EngineError (not_found)
    void delete_checkpoint(const ForkId& fork_id, std::string_view checkpoint_id);

    // -- Recalculation --------------------------------------------------------

    /// The fork's recalc mutex, created on first use. Lock it to serialize
    /// with other recalculations of the same fork.
    /// @throws EngineError (not_found) if the fork does not exist.
    auto acquire_recalc_lock(const ForkId& fork_id) -> std::shared_ptr<std::mutex>;

    /// Prune the fork's lock entry if nobody else references it. Callers
    /// must drop their own shared_ptr first; a no-op while still referenced.
    /// @return true if the entry was removed.
    auto release_recalc_lock(const ForkId& fork_id) -> bool;

    /// Recalculate one fork under its recalc lock and a global permit.
    /// @throws EngineError (not_found) if the fork does not exist.
    auto recalculate(const ForkId& fork_id, RecalcBackend& backend) -> RecalcResult;

    /// Recalculate several forks concurrently. Per-fork engine errors are
    /// reported as failed results rather than thrown.
    auto recalculate_many(std::span<const ForkId> fork_ids, RecalcBackend& backend)
        -> std::vector<RecalcResult>;

    /// Check that every unreferenced lock entry belongs to a live fork.
    /// @throws EngineError (lock_table_corruption)
    void verify_lock_table() const;

    /// Number of entries in the recalc lock table.
    auto recalc_lock_count() const -> std::size_t { return recalc_locks_.size(); }

    // -- Background cleanup ---------------------------------------------------

    /// Start a thread calling evict_expired() every cleanup_interval.
    /// Calling it again while running has no effect. Stopped by the
    /// destructor.
    void start_cleanup_task();

private:
    /// A fork pinned for mutation: the context plus its held intent lock.
    struct MutationScope {
        std::shared_ptr<ForkContext> context;
        std::unique_lock<std::timed_mutex> intent;
    };

    auto find_context(std::string_view operation, const ForkId& fork_id) const
        -> std::shared_ptr<ForkContext>;

    /// Look up, take the intent lock (bounded), reject closed forks.
    auto pin(std::string_view operation, const ForkId& fork_id) -> MutationScope;

    /// pin() followed by version validation.
    auto begin_mutation(std::string_view operation, const ForkId& fork_id, Version expected)
        -> MutationScope;

    /// Versioned mutation reporting failures under `operation`.
    template <typename Fn>
    auto mutate(std::string_view operation, const ForkId& fork_id, Version expected, Fn&& fn)
        -> std::invoke_result_t<Fn, ForkTransaction&>;

    /// Erase a fork from the map and lock table while its intent is held.
    void detach(const ForkContext& context);

    /// Remove a pinned fork and its files.
    /// @return false if the working copy could not be removed.
    auto remove_pinned(MutationScope scope, std::string_view reason) -> bool;

    /// delete_fork() and discard_fork().
    void remove_fork(std::string_view operation, const ForkId& fork_id);

    /// Rollback hook for ForkCreationGuard. Never throws.
    void abort_creation(const ForkId& fork_id) noexcept;

    auto allocate_fork_id() -> ForkId;
    auto allocate_checkpoint_id() -> std::string;
    auto checkpoint_dir(const ForkId& fork_id) const -> std::filesystem::path;

    /// Reject paths with unsupported extensions or outside workspace_root.
    void validate_location(std::string_view operation, const std::filesystem::path& path) const;

    void cleanup_loop(std::stop_token st);

    ForkConfig config_;
    std::shared_ptr<SourceStorage> storage_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ForkId, std::shared_ptr<ForkContext>> forks_;

    RecalcLockTable recalc_locks_;
    std::counting_semaphore<> recalc_permits_;

    std::atomic<std::uint64_t> next_sequence_{1};
    std::atomic<std::uint64_t> next_checkpoint_{1};

    std::mutex cleanup_mutex_;
    std::condition_variable_any cleanup_cv_;
    std::jthread cleanup_thread_;  // last: joined before the members it uses
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, ForkTransaction&>
auto ForkRegistry::with_fork_mut_versioned(const ForkId& fork_id, Version expected, Fn&& fn)
    -> std::invoke_result_t<Fn, ForkTransaction&> {
    return mutate("with_fork_mut_versioned", fork_id, expected, std::forward<Fn>(fn));
}

template <typename Fn>
auto ForkRegistry::mutate(std::string_view operation, const ForkId& fork_id, Version expected,
                          Fn&& fn) -> std::invoke_result_t<Fn, ForkTransaction&> {
    auto scope = begin_mutation(operation, fork_id, expected);
    auto tx = ForkTransaction{*scope.context};
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, ForkTransaction&>>) {
        std::forward<Fn>(fn)(tx);
        tx.commit();
    } else {
        auto result = std::forward<Fn>(fn)(tx);
        tx.commit();
        return result;
    }
}

}  // namespace sheetfork_cpp
