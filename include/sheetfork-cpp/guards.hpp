/// @file guards.hpp
/// @brief Scoped cleanup guards: TempFileGuard, ForkCreationGuard,
/// CheckpointGuard.
///
/// Each guard is armed on construction and performs its cleanup when it
/// goes out of scope, on every exit path, unless disarm() was called.
/// Cleanup never throws: failures are logged through the engine logger so
/// a cleanup error can never mask the error that caused the unwind.
///
/// @code
/// auto guard = TempFileGuard{staging_path};
/// write_contents(staging_path);      // may throw: file is removed
/// std::filesystem::rename(staging_path, target);
/// guard.disarm();                    // promoted: keep it
/// @endcode

#pragma once

#include <sheetfork-cpp/types.hpp>

#include <filesystem>

namespace sheetfork_cpp {

class ForkRegistry;

/// Removes a temporary file at scope end unless disarmed.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path);
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    auto operator=(const TempFileGuard&) -> TempFileGuard& = delete;
    TempFileGuard(TempFileGuard&&) = delete;
    auto operator=(TempFileGuard&&) -> TempFileGuard& = delete;

    auto path() const -> const std::filesystem::path& { return path_; }
    auto armed() const -> bool { return armed_; }

    /// Keep the file. Returns its path.
    auto disarm() -> std::filesystem::path;

private:
    std::filesystem::path path_;
    bool armed_{true};
};

/// Rolls back a partially created fork: removes its registry entry, its
/// recalc lock entry and its working file unless disarmed after commit.
class ForkCreationGuard {
public:
    ForkCreationGuard(ForkRegistry& registry, ForkId fork_id,
                      std::filesystem::path work_path);
    ~ForkCreationGuard();

    ForkCreationGuard(const ForkCreationGuard&) = delete;
    auto operator=(const ForkCreationGuard&) -> ForkCreationGuard& = delete;
    ForkCreationGuard(ForkCreationGuard&&) = delete;
    auto operator=(ForkCreationGuard&&) -> ForkCreationGuard& = delete;

    auto fork_id() const -> const ForkId& { return fork_id_; }
    auto armed() const -> bool { return armed_; }

    /// The fork is fully registered: keep everything.
    void disarm() { armed_ = false; }

private:
    ForkRegistry& registry_;
    ForkId fork_id_;
    std::filesystem::path work_path_;
    bool armed_{true};
};

/// Removes an orphaned checkpoint snapshot unless disarmed after the
/// checkpoint record is registered with its fork.
class CheckpointGuard {
public:
    explicit CheckpointGuard(std::filesystem::path snapshot_path);
    ~CheckpointGuard();

    CheckpointGuard(const CheckpointGuard&) = delete;
    auto operator=(const CheckpointGuard&) -> CheckpointGuard& = delete;
    CheckpointGuard(CheckpointGuard&&) = delete;
    auto operator=(CheckpointGuard&&) -> CheckpointGuard& = delete;

    auto path() const -> const std::filesystem::path& { return path_; }
    auto armed() const -> bool { return armed_; }

    /// The checkpoint is registered: keep the snapshot.
    void disarm() { armed_ = false; }

private:
    std::filesystem::path path_;
    bool armed_{true};
};

}  // namespace sheetfork_cpp
