/// @file recalc_lock_table.hpp
/// @brief Per-fork lock striping for recalculation.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sheetfork_cpp {

/// A key -> reference-counted mutex table.
///
/// Each key gets its own std::mutex, created lazily on first acquire and
/// pruned once nobody but the table references it. Holders keep the
/// mutex alive through the returned shared_ptr, so pruning an entry never
/// invalidates a lock that is still in use.
///
/// Lookups of existing entries take a shared lock on the table; only
/// creation and pruning take it exclusively.
class RecalcLockTable {
public:
    RecalcLockTable() = default;

    RecalcLockTable(const RecalcLockTable&) = delete;
    auto operator=(const RecalcLockTable&) -> RecalcLockTable& = delete;

    /// Return the mutex for `key`, creating it if absent.
    auto acquire(const std::string& key) -> std::shared_ptr<std::mutex>;

    /// Drop the entry for `key` if the table holds the only reference.
    /// @return true if an entry was removed.
    auto release(const std::string& key) -> bool;

    /// Remove the entry for `key` regardless of holders. Outstanding
    /// shared_ptrs keep their mutex alive.
    void erase(const std::string& key);

    auto contains(const std::string& key) const -> bool;
    auto size() const -> std::size_t;

    /// Number of references to `key`'s mutex outside the table.
    auto holders(const std::string& key) const -> long;

    /// Keys whose mutex nobody outside the table references.
    auto unreferenced_keys() const -> std::vector<std::string>;

    auto keys() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace sheetfork_cpp
