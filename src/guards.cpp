#include <sheetfork-cpp/guards.hpp>
#include <sheetfork-cpp/fork_registry.hpp>
#include <sheetfork-cpp/logging.hpp>

#include "fs_util.hpp"

#include <utility>

namespace sheetfork_cpp {

// -- TempFileGuard ------------------------------------------------------------

TempFileGuard::TempFileGuard(std::filesystem::path path)
    : path_{std::move(path)} {}

TempFileGuard::~TempFileGuard() {
    if (!armed_) return;
    detail::remove_quietly(path_, "guard rollback: TempFileGuard");
}

auto TempFileGuard::disarm() -> std::filesystem::path {
    armed_ = false;
    return path_;
}

// -- ForkCreationGuard --------------------------------------------------------

ForkCreationGuard::ForkCreationGuard(ForkRegistry& registry, ForkId fork_id,
                                     std::filesystem::path work_path)
    : registry_{registry}, fork_id_{std::move(fork_id)}, work_path_{std::move(work_path)} {}

ForkCreationGuard::~ForkCreationGuard() {
    if (!armed_) return;
    registry_.abort_creation(fork_id_);
    detail::remove_quietly(work_path_, "guard rollback: ForkCreationGuard");
}

// -- CheckpointGuard ----------------------------------------------------------

CheckpointGuard::CheckpointGuard(std::filesystem::path snapshot_path)
    : path_{std::move(snapshot_path)} {}

CheckpointGuard::~CheckpointGuard() {
    if (!armed_) return;
    detail::remove_quietly(path_, "guard rollback: CheckpointGuard");
}

}  // namespace sheetfork_cpp
