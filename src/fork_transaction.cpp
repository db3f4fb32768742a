#include <sheetfork-cpp/fork_transaction.hpp>
#include <sheetfork-cpp/fork_context.hpp>
#include <sheetfork-cpp/guards.hpp>
#include <sheetfork-cpp/logging.hpp>

#include "fs_util.hpp"

#include <utility>

namespace sheetfork_cpp {

ForkTransaction::ForkTransaction(ForkContext& context)
    : context_{context}, base_version_{context.version()} {}

auto ForkTransaction::fork_id() const -> const ForkId& {
    return context_.fork_id();
}

auto ForkTransaction::workbook_id() const -> const WorkbookId& {
    return context_.workbook_id();
}

auto ForkTransaction::work_path() const -> const std::filesystem::path& {
    return context_.work_path();
}

auto ForkTransaction::committed_edits() const -> std::vector<EditOp> {
    return context_.edits();
}

void ForkTransaction::record_edit(EditOp edit) {
    if (edit.timestamp == Clock::time_point{}) edit.timestamp = Clock::now();
    pending_edits_.push_back(std::move(edit));
}

void ForkTransaction::record_edit(std::string sheet, std::string address, std::string value,
                                  bool is_formula) {
    record_edit(EditOp{
        .timestamp = Clock::now(),
        .sheet = std::move(sheet),
        .address = std::move(address),
        .value = std::move(value),
        .is_formula = is_formula,
    });
}

auto ForkTransaction::find_checkpoint(std::string_view checkpoint_id) const
    -> std::optional<CheckpointInfo> {
    return context_.find_checkpoint(checkpoint_id);
}

void ForkTransaction::replace_work_copy(const std::filesystem::path& source) {
    constexpr auto op = std::string_view{"replace_work_copy"};
    auto staging = context_.work_path();
    staging += ".staging-" + detail::random_hex(8);

    auto guard = TempFileGuard{staging};
    detail::copy_file(source, staging, op);
    detail::replace_file(staging, context_.work_path(), op);
    guard.disarm();
}

auto ForkTransaction::commit() -> Version {
    auto staged = pending_edits_.size();
    auto version = context_.commit_edits(std::move(pending_edits_));
    pending_edits_.clear();
    SHEETFORK_LOG_DEBUG("fork mutated fork_id={} version={} edits={}",
                        context_.fork_id().str(), version, staged);
    return version;
}

}  // namespace sheetfork_cpp
