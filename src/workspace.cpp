#include <sheetfork-cpp/workspace.hpp>
#include <sheetfork-cpp/logging.hpp>

#include <utility>

namespace sheetfork_cpp {

namespace {

auto prepare(EngineConfig config) -> EngineConfig {
    config.propagate_workspace_root();
    set_log_level(config.log_level);
    return config;
}

}  // namespace

Workspace::Workspace(EngineConfig config, WorkbookLoader loader,
                     std::shared_ptr<SourceStorage> storage)
    : config_{prepare(std::move(config))},
      cache_{config_.cache, std::move(loader)},
      registry_{config_.forks, std::move(storage)} {
    cache_.set_path_resolver([this](std::string_view id) {
        return registry_.find_fork_path(ForkId{std::string{id}});
    });
    SHEETFORK_LOG_INFO("workspace ready root={} cache_capacity={}",
                       config_.workspace_root.string(), config_.cache.capacity);
}

auto Workspace::open_workbook(std::string_view id_or_alias) -> WorkbookHandle {
    return cache_.open_workbook(id_or_alias);
}

auto Workspace::create_fork(std::string_view workbook_id) -> ForkId {
    auto path = cache_.resolve_workbook_path(workbook_id);
    return registry_.create_fork(cache_.canonicalize(workbook_id), path);
}

void Workspace::save_fork(const ForkId& fork_id, const std::filesystem::path& target_path,
                          bool allow_overwrite) {
    auto work_path = registry_.find_fork_path(fork_id);
    registry_.save_fork(fork_id, target_path, allow_overwrite);
    cache_.evict_by_path(target_path);
    evict_fork_views(fork_id, work_path);
}

void Workspace::discard_fork(const ForkId& fork_id) {
    auto work_path = registry_.find_fork_path(fork_id);
    registry_.discard_fork(fork_id);
    evict_fork_views(fork_id, work_path);
}

auto Workspace::checkpoint_fork(const ForkId& fork_id, std::optional<std::string> label)
    -> CheckpointInfo {
    return registry_.checkpoint_fork(fork_id, std::move(label));
}

auto Workspace::restore_checkpoint(const ForkId& fork_id, Version expected,
                                   std::string_view checkpoint_id) -> Version {
    auto version = registry_.restore_checkpoint(fork_id, expected, checkpoint_id);
    cache_.close_workbook(fork_id.str());
    return version;
}

auto Workspace::recalculate(const ForkId& fork_id, RecalcBackend& backend) -> RecalcResult {
    auto result = registry_.recalculate(fork_id, backend);
    if (result.success) cache_.close_workbook(fork_id.str());
    return result;
}

void Workspace::evict_fork_views(const ForkId& fork_id,
                                 const std::optional<std::filesystem::path>& work_path) {
    cache_.close_workbook(fork_id.str());
    if (work_path) cache_.evict_by_path(*work_path);
    cache_.forget_location(WorkbookId{fork_id.str()});
}

}  // namespace sheetfork_cpp
