#include <sheetfork-cpp/fork_context.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/logging.hpp>

#include "fs_util.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace sheetfork_cpp {

ForkContext::ForkContext(ForkId fork_id, WorkbookId workbook_id,
                         std::filesystem::path base_path, std::filesystem::path work_path,
                         FileFingerprint base_fingerprint)
    : fork_id_{std::move(fork_id)},
      workbook_id_{std::move(workbook_id)},
      base_path_{std::move(base_path)},
      work_path_{std::move(work_path)},
      base_fingerprint_{base_fingerprint},
      created_at_{Clock::now()},
      created_steady_{std::chrono::steady_clock::now()} {}

void ForkContext::validate_version(Version expected, std::string_view operation) const {
    auto current = version();
    if (current != expected) {
        SHEETFORK_LOG_DEBUG("version conflict fork_id={} expected={} current={}",
                            fork_id_.str(), expected, current);
        throw version_conflict(operation, fork_id_.str(), expected, current);
    }
}

auto ForkContext::age() const -> std::chrono::steady_clock::duration {
    return std::chrono::steady_clock::now() - created_steady_;
}

auto ForkContext::is_expired(std::chrono::steady_clock::duration ttl) const -> bool {
    return age() > ttl;
}

void ForkContext::validate_base_unchanged() const {
    constexpr auto op = std::string_view{"validate_base_unchanged"};
    auto current = detail::fingerprint(base_path_, op);
    if (current.size != base_fingerprint_.size || current.modified != base_fingerprint_.modified) {
        throw make_error(ErrorKind::base_modified, op, base_path_.string(),
                         "base file modified since fork creation");
    }
    if (current.crc32 != base_fingerprint_.crc32) {
        throw make_error(ErrorKind::base_modified, op, base_path_.string(),
                         "base file content changed since fork creation");
    }
}

auto ForkContext::edits() const -> std::vector<EditOp> {
    auto lock = std::shared_lock{state_mutex_};
    return edits_;
}

auto ForkContext::edit_count() const -> std::size_t {
    auto lock = std::shared_lock{state_mutex_};
    return edits_.size();
}

auto ForkContext::checkpoints() const -> std::vector<CheckpointInfo> {
    auto lock = std::shared_lock{state_mutex_};
    return checkpoints_;
}

auto ForkContext::find_checkpoint(std::string_view checkpoint_id) const
    -> std::optional<CheckpointInfo> {
    auto lock = std::shared_lock{state_mutex_};
    auto it = std::ranges::find(checkpoints_, checkpoint_id, &CheckpointInfo::checkpoint_id);
    if (it == checkpoints_.end()) return std::nullopt;
    return *it;
}

auto ForkContext::info() const -> ForkInfo {
    auto lock = std::shared_lock{state_mutex_};
    return ForkInfo{
        .fork_id = fork_id_,
        .workbook_id = workbook_id_,
        .base_path = base_path_,
        .work_path = work_path_,
        .version = version(),
        .created_at = created_at_,
        .edit_count = edits_.size(),
        .checkpoint_count = checkpoints_.size(),
    };
}

auto ForkContext::commit_edits(std::vector<EditOp> edits) -> Version {
    auto lock = std::unique_lock{state_mutex_};
    edits_.insert(edits_.end(),
                  std::make_move_iterator(edits.begin()),
                  std::make_move_iterator(edits.end()));
    return increment_version();
}

auto ForkContext::add_checkpoint(CheckpointInfo checkpoint, std::size_t limit)
    -> std::vector<CheckpointInfo> {
    auto lock = std::unique_lock{state_mutex_};
    checkpoints_.push_back(std::move(checkpoint));
    auto pruned = std::vector<CheckpointInfo>{};
    if (limit > 0 && checkpoints_.size() > limit) {
        auto excess = static_cast<std::ptrdiff_t>(checkpoints_.size() - limit);
        pruned.assign(std::make_move_iterator(checkpoints_.begin()),
                      std::make_move_iterator(checkpoints_.begin() + excess));
        checkpoints_.erase(checkpoints_.begin(), checkpoints_.begin() + excess);
    }
    return pruned;
}

auto ForkContext::remove_checkpoint(std::string_view checkpoint_id)
    -> std::optional<CheckpointInfo> {
    auto lock = std::unique_lock{state_mutex_};
    auto it = std::ranges::find(checkpoints_, checkpoint_id, &CheckpointInfo::checkpoint_id);
    if (it == checkpoints_.end()) return std::nullopt;
    auto removed = std::move(*it);
    checkpoints_.erase(it);
    return removed;
}

}  // namespace sheetfork_cpp
