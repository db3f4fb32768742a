/// @file fork_transaction.hpp
/// @brief ForkTransaction -- the interface handed to a fork mutator.

#pragma once

#include <sheetfork-cpp/types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetfork_cpp {

class ForkContext;

/// A mutation interface for a single fork.
///
/// Transactions are created exclusively by
/// ForkRegistry::with_fork_mut_versioned(), which holds the fork's
/// exclusive intent for the transaction's whole lifetime. Edits recorded
/// through the transaction are staged and only become visible (together
/// with the version increment) when the mutator returns normally. If the
/// mutator throws, nothing staged is applied.
///
/// @code
/// registry.with_fork_mut_versioned(fork_id, 0, [](ForkTransaction& tx) {
///     write_cell(tx.work_path(), "Data", "A1", "42");
///     tx.record_edit("Data", "A1", "42");
/// });
/// @endcode
class ForkTransaction {
    friend class ForkRegistry;
    explicit ForkTransaction(ForkContext& context);

public:
    ForkTransaction(const ForkTransaction&) = delete;
    auto operator=(const ForkTransaction&) -> ForkTransaction& = delete;

    auto fork_id() const -> const ForkId&;
    auto workbook_id() const -> const WorkbookId&;
    auto work_path() const -> const std::filesystem::path&;

    /// The version this transaction builds on (the validated expectation).
    auto base_version() const -> Version { return base_version_; }

    /// Edits committed before this transaction.
    auto committed_edits() const -> std::vector<EditOp>;

    /// Edits staged by this transaction so far.
    auto pending_edits() const -> const std::vector<EditOp>& { return pending_edits_; }

    /// Stage an edit. A default timestamp is replaced with the current time.
    void record_edit(EditOp edit);

    /// Stage an edit from its parts.
    void record_edit(std::string sheet, std::string address, std::string value,
                     bool is_formula = false);

    /// Look up one of the fork's checkpoints.
    auto find_checkpoint(std::string_view checkpoint_id) const -> std::optional<CheckpointInfo>;

    /// Replace the working copy with the contents of `source`.
    ///
    /// The contents are staged beside the working copy and renamed over it,
    /// so on failure the working copy is unchanged.
    /// @throws EngineError (io_failure) if staging or the rename fails.
    void replace_work_copy(const std::filesystem::path& source);

private:
    /// Apply staged edits and increment the version. Returns the new version.
    auto commit() -> Version;

    ForkContext& context_;
    Version base_version_;
    std::vector<EditOp> pending_edits_;
};

}  // namespace sheetfork_cpp
