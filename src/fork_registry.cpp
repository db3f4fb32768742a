#include <sheetfork-cpp/fork_registry.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/guards.hpp>
#include <sheetfork-cpp/logging.hpp>

#include "executor.hpp"
#include "fs_util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>

namespace sheetfork_cpp {

namespace {

// Holds a fork's recalc mutex and prunes its table entry on scope exit.
class RecalcLease {
public:
    RecalcLease(ForkRegistry& registry, ForkId fork_id, std::shared_ptr<std::mutex> lock)
        : registry_{registry}, fork_id_{std::move(fork_id)}, lock_{std::move(lock)} {}

    ~RecalcLease() {
        lock_.reset();
        try {
            registry_.release_recalc_lock(fork_id_);
        } catch (const std::exception& e) {
            SHEETFORK_LOG_WARN("recalc lock release failed fork_id={}: {}", fork_id_.str(), e.what());
        }
    }

    RecalcLease(const RecalcLease&) = delete;
    auto operator=(const RecalcLease&) -> RecalcLease& = delete;

    auto mutex() -> std::mutex& { return *lock_; }

private:
    ForkRegistry& registry_;
    ForkId fork_id_;
    std::shared_ptr<std::mutex> lock_;
};

// One of max_concurrent_recalcs global slots.
class RecalcPermit {
public:
    explicit RecalcPermit(std::counting_semaphore<>& permits) : permits_{permits} {
        permits_.acquire();
    }
    ~RecalcPermit() { permits_.release(); }

    RecalcPermit(const RecalcPermit&) = delete;
    auto operator=(const RecalcPermit&) -> RecalcPermit& = delete;

private:
    std::counting_semaphore<>& permits_;
};

auto permit_count(std::size_t configured) -> std::ptrdiff_t {
    return static_cast<std::ptrdiff_t>(std::max<std::size_t>(1, configured));
}

}  // namespace

ForkRegistry::ForkRegistry(ForkConfig config, std::shared_ptr<SourceStorage> storage)
    : config_{std::move(config)},
      storage_{storage ? std::move(storage) : std::make_shared<FilesystemStorage>()},
      recalc_permits_{permit_count(config_.max_concurrent_recalcs)} {
    auto ec = std::error_code{};
    std::filesystem::create_directories(config_.fork_dir / "checkpoints", ec);
    if (ec) throw io_failure("ForkRegistry", config_.fork_dir.string(), ec.message());
    SHEETFORK_LOG_INFO("fork registry ready fork_dir={} max_forks={} ttl={}s",
                       config_.fork_dir.string(), config_.max_forks, config_.ttl.count());
}

ForkRegistry::~ForkRegistry() {
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.request_stop();
        cleanup_thread_.join();
    }
}

// -- Creation -----------------------------------------------------------------

auto ForkRegistry::create_fork(const WorkbookId& workbook_id,
                               const std::filesystem::path& base_path) -> ForkId {
    constexpr auto op = std::string_view{"create_fork"};

    evict_expired();
    if (fork_count() >= config_.max_forks) {
        throw make_error(ErrorKind::limit_exceeded, op, workbook_id.str(),
                         fmt::format("fork limit of {} reached", config_.max_forks));
    }

    validate_location(op, base_path);
    auto ec = std::error_code{};
    if (!std::filesystem::is_regular_file(base_path, ec)) throw not_found(op, base_path.string());
    auto size = std::filesystem::file_size(base_path, ec);
    if (ec) throw io_failure(op, base_path.string(), ec.message());
    if (size > config_.max_file_size) {
        throw make_error(ErrorKind::invalid_argument, op, base_path.string(),
                         fmt::format("file is {} bytes, limit is {}", size, config_.max_file_size));
    }

    auto fork_id = allocate_fork_id();
    auto work_path = config_.fork_dir /
        (fork_id.str() + detail::ascii_lower(base_path.extension().string()));
    auto guard = ForkCreationGuard{*this, fork_id, work_path};

    storage_->copy_to(base_path, work_path);
    auto base_fingerprint = detail::fingerprint(base_path, op);
    auto context = std::make_shared<ForkContext>(fork_id, workbook_id, base_path, work_path,
                                                 base_fingerprint);
    {
        auto lock = std::unique_lock{mutex_};
        if (forks_.size() >= config_.max_forks) {
            throw make_error(ErrorKind::limit_exceeded, op, fork_id.str(),
                             fmt::format("fork limit of {} reached", config_.max_forks));
        }
        forks_.emplace(fork_id, std::move(context));
    }
    guard.disarm();

    SHEETFORK_LOG_INFO("fork created fork_id={} workbook_id={} base={}",
                       fork_id.str(), workbook_id.str(), base_path.string());
    return fork_id;
}

void ForkRegistry::abort_creation(const ForkId& fork_id) noexcept {
    try {
        SHEETFORK_LOG_DEBUG("guard rollback: abandoning fork {}", fork_id.str());
        {
            auto lock = std::unique_lock{mutex_};
            forks_.erase(fork_id);
        }
        recalc_locks_.erase(fork_id.str());
    } catch (const std::exception& e) {
        detail::log_cleanup_failure("abort_creation", e.what());
    }
}

// -- Reading ------------------------------------------------------------------

auto ForkRegistry::find_context(std::string_view operation, const ForkId& fork_id) const
    -> std::shared_ptr<ForkContext> {
    auto lock = std::shared_lock{mutex_};
    auto it = forks_.find(fork_id);
    if (it == forks_.end()) throw not_found(operation, fork_id.str());
    return it->second;
}

auto ForkRegistry::get_fork_path(const ForkId& fork_id) const -> std::filesystem::path {
    return find_context("get_fork_path", fork_id)->work_path();
}

auto ForkRegistry::find_fork_path(const ForkId& fork_id) const
    -> std::optional<std::filesystem::path> {
    auto lock = std::shared_lock{mutex_};
    auto it = forks_.find(fork_id);
    if (it == forks_.end()) return std::nullopt;
    return it->second->work_path();
}

auto ForkRegistry::get_fork(const ForkId& fork_id) const -> ForkInfo {
    return find_context("get_fork", fork_id)->info();
}

auto ForkRegistry::get_version(const ForkId& fork_id) const -> Version {
    return find_context("get_version", fork_id)->version();
}

auto ForkRegistry::list_forks() const -> std::vector<ForkInfo> {
    auto contexts = std::vector<std::shared_ptr<ForkContext>>{};
    {
        auto lock = std::shared_lock{mutex_};
        contexts.reserve(forks_.size());
        for (const auto& [id, context] : forks_) contexts.push_back(context);
    }
    auto result = std::vector<ForkInfo>{};
    result.reserve(contexts.size());
    for (const auto& context : contexts) result.push_back(context->info());
    std::ranges::sort(result, [](const ForkInfo& a, const ForkInfo& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.fork_id < b.fork_id;
    });
    return result;
}

auto ForkRegistry::fork_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return forks_.size();
}

auto ForkRegistry::contains(const ForkId& fork_id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return forks_.contains(fork_id);
}

// -- Mutation -----------------------------------------------------------------

auto ForkRegistry::pin(std::string_view operation, const ForkId& fork_id) -> MutationScope {
    auto context = find_context(operation, fork_id);
    auto intent = std::unique_lock{context->intent_mutex_, std::defer_lock};
    if (!intent.try_lock_for(config_.lock_timeout)) {
        SHEETFORK_LOG_WARN("exclusive intent timed out fork_id={} op={} timeout={}ms",
                           fork_id.str(), operation, config_.lock_timeout.count());
        throw make_error(ErrorKind::lock_timeout, operation, fork_id.str(),
                         fmt::format("fork busy for more than {} ms", config_.lock_timeout.count()));
    }
    // Removed while we waited.
    if (context->closed()) throw not_found(operation, fork_id.str());
    return MutationScope{std::move(context), std::move(intent)};
}

auto ForkRegistry::begin_mutation(std::string_view operation, const ForkId& fork_id,
                                  Version expected) -> MutationScope {
    // A stale version fails without waiting for a running mutation.
    find_context(operation, fork_id)->validate_version(expected, operation);
    auto scope = pin(operation, fork_id);
    scope.context->validate_version(expected, operation);
    return scope;
}

// -- Removal ------------------------------------------------------------------

void ForkRegistry::detach(const ForkContext& context) {
    auto lock = std::unique_lock{mutex_};
    forks_.erase(context.fork_id());
    // Under the registry lock so acquire_recalc_lock() cannot recreate it.
    recalc_locks_.release(context.fork_id().str());
}

auto ForkRegistry::remove_pinned(MutationScope scope, std::string_view reason) -> bool {
    auto& context = *scope.context;
    detach(context);
    context.mark_closed();
    scope.intent.unlock();

    auto removed = detail::remove_quietly(context.work_path(), reason);
    detail::remove_tree_quietly(checkpoint_dir(context.fork_id()), reason);
    SHEETFORK_LOG_INFO("fork removed fork_id={} reason={}", context.fork_id().str(), reason);
    return removed;
}

void ForkRegistry::remove_fork(std::string_view operation, const ForkId& fork_id) {
    auto scope = pin(operation, fork_id);
    auto work_path = scope.context->work_path();
    if (!remove_pinned(std::move(scope), operation)) {
        throw io_failure(operation, fork_id.str(),
                         "working copy could not be removed: " + work_path.string());
    }
}

void ForkRegistry::delete_fork(const ForkId& fork_id) {
    remove_fork("delete_fork", fork_id);
}

void ForkRegistry::discard_fork(const ForkId& fork_id) {
    remove_fork("discard_fork", fork_id);
}

void ForkRegistry::save_fork(const ForkId& fork_id, const std::filesystem::path& target_path,
                             bool allow_overwrite) {
    constexpr auto op = std::string_view{"save_fork"};
    auto scope = pin(op, fork_id);
    validate_location(op, target_path);
    auto ec = std::error_code{};
    if (!allow_overwrite && std::filesystem::exists(target_path, ec)) {
        throw make_error(ErrorKind::invalid_argument, op, target_path.string(),
                         "target exists and overwrite was not allowed");
    }
    scope.context->validate_base_unchanged();

    auto staging = target_path.parent_path() /
        fmt::format(".{}.sheetfork-{}.tmp", target_path.filename().string(), detail::random_hex(8));
    {
        auto guard = TempFileGuard{staging};
        detail::copy_file(scope.context->work_path(), staging, op);
        detail::replace_file(staging, target_path, op);
        guard.disarm();
    }
    SHEETFORK_LOG_INFO("fork saved fork_id={} target={} version={}",
                       fork_id.str(), target_path.string(), scope.context->version());

    // The target is already written; a stale working copy is only logged.
    remove_pinned(std::move(scope), op);
}

auto ForkRegistry::evict_expired() -> std::size_t {
    auto expired = std::vector<std::shared_ptr<ForkContext>>{};
    {
        auto lock = std::shared_lock{mutex_};
        for (const auto& [id, context] : forks_) {
            if (context->is_expired(config_.ttl)) expired.push_back(context);
        }
    }

    auto removed = std::size_t{0};
    for (auto& context : expired) {
        auto intent = std::unique_lock{context->intent_mutex_, std::try_to_lock};
        if (!intent.owns_lock()) {
            SHEETFORK_LOG_DEBUG("expired fork busy, skipped fork_id={}", context->fork_id().str());
            continue;
        }
        if (context->closed()) continue;
        remove_pinned(MutationScope{context, std::move(intent)}, "evict_expired");
        ++removed;
    }
    if (removed > 0) SHEETFORK_LOG_INFO("evicted {} expired fork(s)", removed);
    return removed;
}

// -- Checkpoints --------------------------------------------------------------

auto ForkRegistry::checkpoint_fork(const ForkId& fork_id, std::optional<std::string> label)
    -> CheckpointInfo {
    constexpr auto op = std::string_view{"checkpoint_fork"};
    auto scope = pin(op, fork_id);
    auto& context = *scope.context;

    auto dir = checkpoint_dir(fork_id);
    auto ec = std::error_code{};
    std::filesystem::create_directories(dir, ec);
    if (ec) throw io_failure(op, dir.string(), ec.message());

    auto checkpoint_id = allocate_checkpoint_id();
    auto snapshot = dir / (checkpoint_id + ".snapshot");
    auto guard = CheckpointGuard{snapshot};
    detail::copy_file(context.work_path(), snapshot, op);
    auto fp = detail::fingerprint(snapshot, op);

    auto info = CheckpointInfo{
        .checkpoint_id = checkpoint_id,
        .fork_id = fork_id,
        .label = std::move(label),
        .snapshot_path = snapshot,
        .fork_version = context.version(),
        .crc32 = fp.crc32,
        .size_bytes = fp.size,
        .created_at = Clock::now(),
    };
    auto pruned = context.add_checkpoint(info, config_.max_checkpoints_per_fork);
    guard.disarm();
    scope.intent.unlock();

    for (const auto& old : pruned) {
        SHEETFORK_LOG_DEBUG("checkpoint pruned fork_id={} checkpoint_id={}",
                            fork_id.str(), old.checkpoint_id);
        detail::remove_quietly(old.snapshot_path, op);
    }
    SHEETFORK_LOG_INFO("checkpoint created fork_id={} checkpoint_id={} version={}",
                       fork_id.str(), checkpoint_id, info.fork_version);
    return info;
}

auto ForkRegistry::list_checkpoints(const ForkId& fork_id) const -> std::vector<CheckpointInfo> {
    return find_context("list_checkpoints", fork_id)->checkpoints();
}

auto ForkRegistry::restore_checkpoint(const ForkId& fork_id, Version expected,
                                      std::string_view checkpoint_id) -> Version {
    constexpr auto op = std::string_view{"restore_checkpoint"};
    mutate(op, fork_id, expected, [&](ForkTransaction& tx) {
        auto checkpoint = tx.find_checkpoint(checkpoint_id);
        if (!checkpoint) throw not_found(op, checkpoint_id);

        auto fp = detail::fingerprint(checkpoint->snapshot_path, op);
        if (fp.size != checkpoint->size_bytes || fp.crc32 != checkpoint->crc32) {
            throw make_error(ErrorKind::checkpoint_invalid, op, checkpoint->checkpoint_id,
                             fmt::format("snapshot crc {:08x}/{} bytes, recorded {:08x}/{} bytes",
                                         fp.crc32, fp.size, checkpoint->crc32,
                                         checkpoint->size_bytes));
        }
        tx.replace_work_copy(checkpoint->snapshot_path);
    });
    SHEETFORK_LOG_INFO("checkpoint restored fork_id={} checkpoint_id={}",
                       fork_id.str(), checkpoint_id);
    // The commit incremented the validated version exactly once.
    return expected + 1;
}

void ForkRegistry::delete_checkpoint(const ForkId& fork_id, std::string_view checkpoint_id) {
    constexpr auto op = std::string_view{"delete_checkpoint"};
    auto scope = pin(op, fork_id);
    auto removed = scope.context->remove_checkpoint(checkpoint_id);
    scope.intent.unlock();
    if (!removed) throw not_found(op, checkpoint_id);
    detail::remove_quietly(removed->snapshot_path, op);
}

// -- Recalculation ------------------------------------------------------------

auto ForkRegistry::acquire_recalc_lock(const ForkId& fork_id) -> std::shared_ptr<std::mutex> {
    auto lock = std::shared_lock{mutex_};
    if (!forks_.contains(fork_id)) throw not_found("acquire_recalc_lock", fork_id.str());
    return recalc_locks_.acquire(fork_id.str());
}

auto ForkRegistry::release_recalc_lock(const ForkId& fork_id) -> bool {
    return recalc_locks_.release(fork_id.str());
}

auto ForkRegistry::recalculate(const ForkId& fork_id, RecalcBackend& backend) -> RecalcResult {
    auto lease = RecalcLease{*this, fork_id, acquire_recalc_lock(fork_id)};
    if (!backend.is_available()) {
        return RecalcResult{.fork_id = fork_id, .message = "recalculation engine unavailable"};
    }

    auto serialized = std::unique_lock{lease.mutex()};
    auto permit = RecalcPermit{recalc_permits_};
    auto work_path = get_fork_path(fork_id);

    SHEETFORK_LOG_DEBUG("recalc started fork_id={}", fork_id.str());
    auto start = std::chrono::steady_clock::now();
    auto result = backend.recalculate(work_path);
    result.fork_id = fork_id;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    SHEETFORK_LOG_DEBUG("recalc finished fork_id={} success={} duration={}ms",
                        fork_id.str(), result.success, result.duration.count());
    return result;
}

auto ForkRegistry::recalculate_many(std::span<const ForkId> fork_ids, RecalcBackend& backend)
    -> std::vector<RecalcResult> {
    auto results = std::vector<RecalcResult>(fork_ids.size());
    auto failure = std::exception_ptr{};
    auto failure_mutex = std::mutex{};

    auto taskflow = tf::Taskflow{};
    for (std::size_t i = 0; i < fork_ids.size(); ++i) {
        taskflow.emplace([&, i] {
            try {
                results[i] = recalculate(fork_ids[i], backend);
            } catch (const EngineError& e) {
                results[i] = RecalcResult{.fork_id = fork_ids[i], .message = e.what()};
            } catch (...) {
                // Rethrown on the calling thread once every task has finished.
                auto lock = std::scoped_lock{failure_mutex};
                if (!failure) failure = std::current_exception();
            }
        });
    }
    detail::recalc_executor().run(taskflow).wait();

    if (failure) std::rethrow_exception(failure);
    return results;
}

void ForkRegistry::verify_lock_table() const {
    auto lock = std::shared_lock{mutex_};
    for (const auto& key : recalc_locks_.unreferenced_keys()) {
        if (!forks_.contains(ForkId{key})) {
            throw make_error(ErrorKind::lock_table_corruption, "verify_lock_table", key,
                             "recalc lock entry has no fork");
        }
    }
}

// -- Background cleanup -------------------------------------------------------

void ForkRegistry::start_cleanup_task() {
    auto lock = std::scoped_lock{cleanup_mutex_};
    if (cleanup_thread_.joinable()) return;
    cleanup_thread_ = std::jthread{[this](std::stop_token st) { cleanup_loop(st); }};
}

void ForkRegistry::cleanup_loop(std::stop_token st) {
    SHEETFORK_LOG_DEBUG("cleanup task started interval={}s", config_.cleanup_interval.count());
    auto lock = std::unique_lock{cleanup_mutex_};
    while (!cleanup_cv_.wait_for(lock, st, config_.cleanup_interval,
                                 [&st] { return st.stop_requested(); })) {
        lock.unlock();
        try {
            evict_expired();
        } catch (const std::exception& e) {
            SHEETFORK_LOG_ERROR("cleanup sweep failed: {}", e.what());
        }
        lock.lock();
    }
    SHEETFORK_LOG_DEBUG("cleanup task stopped");
}

// -- Helpers ------------------------------------------------------------------

auto ForkRegistry::allocate_fork_id() -> ForkId {
    auto sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);
    return ForkId{fmt::format("fork-{}-{}", detail::random_hex(16), sequence)};
}

auto ForkRegistry::allocate_checkpoint_id() -> std::string {
    auto sequence = next_checkpoint_.fetch_add(1, std::memory_order_relaxed);
    return fmt::format("cp-{}-{}", detail::random_hex(8), sequence);
}

auto ForkRegistry::checkpoint_dir(const ForkId& fork_id) const -> std::filesystem::path {
    return config_.fork_dir / "checkpoints" / fork_id.str();
}

void ForkRegistry::validate_location(std::string_view operation,
                                     const std::filesystem::path& path) const {
    if (!has_supported_extension(path, config_.supported_extensions)) {
        throw make_error(ErrorKind::invalid_argument, operation, path.string(),
                         fmt::format("unsupported extension '{}'", path.extension().string()));
    }
    if (config_.workspace_root.empty()) return;

    auto ec = std::error_code{};
    auto root = std::filesystem::weakly_canonical(config_.workspace_root, ec);
    if (ec) throw io_failure(operation, config_.workspace_root.string(), ec.message());
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) throw io_failure(operation, path.string(), ec.message());

    auto relative = resolved.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        throw make_error(ErrorKind::invalid_argument, operation, path.string(),
                         "path is outside the workspace root " + root.string());
    }
}

}  // namespace sheetfork_cpp
