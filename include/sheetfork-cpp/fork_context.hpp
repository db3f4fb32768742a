/// @file fork_context.hpp
/// @brief ForkContext -- identity, source linkage, working copy and
/// version stamp of a single fork.

#pragma once

#include <sheetfork-cpp/types.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sheetfork_cpp {

/// The state of one fork.
///
/// ForkContext is owned by ForkRegistry. Identity, paths and the base
/// fingerprint are immutable after construction and can be read without
/// locking. The version is an atomic. The edit log and checkpoint list
/// are guarded by an internal shared_mutex held only to copy in or out.
///
/// Mutation of a fork is serialized by its exclusive-intent lock, which
/// ForkRegistry holds from version validation to commit.
class ForkContext {
    friend class ForkRegistry;
    friend class ForkTransaction;

public:
    ForkContext(ForkId fork_id, WorkbookId workbook_id,
                std::filesystem::path base_path, std::filesystem::path work_path,
                FileFingerprint base_fingerprint);

    ForkContext(const ForkContext&) = delete;
    auto operator=(const ForkContext&) -> ForkContext& = delete;

    // -- Identity -------------------------------------------------------------

    auto fork_id() const -> const ForkId& { return fork_id_; }
    auto workbook_id() const -> const WorkbookId& { return workbook_id_; }
    auto base_path() const -> const std::filesystem::path& { return base_path_; }
    auto work_path() const -> const std::filesystem::path& { return work_path_; }
    auto created_at() const -> Clock::time_point { return created_at_; }
    auto base_fingerprint() const -> const FileFingerprint& { return base_fingerprint_; }

    // -- Version --------------------------------------------------------------

    /// Current version. Lock-free.
    auto version() const noexcept -> Version {
        return version_.load(std::memory_order_acquire);
    }

    /// Increment the version and return the new value. Lock-free.
    auto increment_version() noexcept -> Version {
        return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    /// Check `expected` against the live version.
    /// @throws EngineError (version_conflict) carrying both versions.
    void validate_version(Version expected,
                          std::string_view operation = "validate_version") const;

    // -- Lifetime -------------------------------------------------------------

    auto age() const -> std::chrono::steady_clock::duration;
    auto is_expired(std::chrono::steady_clock::duration ttl) const -> bool;

    /// True once the fork has been saved, discarded or expired.
    auto closed() const noexcept -> bool {
        return closed_.load(std::memory_order_acquire);
    }

    /// Re-fingerprint the base file and compare with the creation snapshot.
    /// @throws EngineError (base_modified) if size, mtime or content changed,
    ///   (not_found) if the base disappeared.
    void validate_base_unchanged() const;

    // -- Metadata snapshots ---------------------------------------------------

    auto edits() const -> std::vector<EditOp>;
    auto edit_count() const -> std::size_t;
    auto checkpoints() const -> std::vector<CheckpointInfo>;
    auto find_checkpoint(std::string_view checkpoint_id) const -> std::optional<CheckpointInfo>;
    auto info() const -> ForkInfo;

private:
    /// Append `edits` and increment the version under one lock, so info()
    /// never sees one without the other. Returns the new version.
    auto commit_edits(std::vector<EditOp> edits) -> Version;

    /// Register a checkpoint; returns those pruned to stay within `limit`.
    auto add_checkpoint(CheckpointInfo checkpoint, std::size_t limit) -> std::vector<CheckpointInfo>;
    auto remove_checkpoint(std::string_view checkpoint_id) -> std::optional<CheckpointInfo>;

    void mark_closed() noexcept { closed_.store(true, std::memory_order_release); }

    const ForkId fork_id_;
    const WorkbookId workbook_id_;
    const std::filesystem::path base_path_;
    const std::filesystem::path work_path_;
    const FileFingerprint base_fingerprint_;
    const Clock::time_point created_at_;
    const std::chrono::steady_clock::time_point created_steady_;

    std::atomic<Version> version_{0};
    std::atomic<bool> closed_{false};

    // Exclusive intent: held by the registry from validation to commit.
    std::timed_mutex intent_mutex_;

    mutable std::shared_mutex state_mutex_;
    std::vector<EditOp> edits_;
    std::vector<CheckpointInfo> checkpoints_;  // oldest first
};

}  // namespace sheetfork_cpp
