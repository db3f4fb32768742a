#include <sheetfork-cpp/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace sheetfork_cpp {

namespace {

auto to_epoch_ms(Clock::time_point t) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

auto from_epoch_ms(std::int64_t ms) -> Clock::time_point {
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

// Assign j[key] to `out` if present; otherwise leave the default.
template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) it->get_to(out);
}

void read_path(const nlohmann::json& j, const char* key, std::filesystem::path& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = std::filesystem::path{it->get<std::string>()};
    }
}

template <typename Duration>
void read_duration(const nlohmann::json& j, const char* key, Duration& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = Duration{it->get<typename Duration::rep>()};
    }
}

}  // namespace

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const WorkbookId& id) { j = id.value; }
void from_json(const nlohmann::json& j, WorkbookId& id) { id.value = j.get<std::string>(); }

void to_json(nlohmann::json& j, const ForkId& id) { j = id.value; }
void from_json(const nlohmann::json& j, ForkId& id) { id.value = j.get<std::string>(); }

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(e.kind)}},
        {"message", e.message},
        {"retryable", is_retryable(e.kind)},
    };
    if (!e.operation.empty()) j["operation"] = e.operation;
    if (!e.subject.empty()) j["subject"] = e.subject;
    if (e.expected_version) j["expected_version"] = *e.expected_version;
    if (e.current_version) j["current_version"] = *e.current_version;
}

// -- Records ------------------------------------------------------------------

void to_json(nlohmann::json& j, const EditOp& op) {
    j = nlohmann::json{
        {"timestamp_ms", to_epoch_ms(op.timestamp)},
        {"sheet", op.sheet},
        {"address", op.address},
        {"value", op.value},
        {"is_formula", op.is_formula},
    };
}

void from_json(const nlohmann::json& j, EditOp& op) {
    j.at("sheet").get_to(op.sheet);
    j.at("address").get_to(op.address);
    j.at("value").get_to(op.value);
    read_optional(j, "is_formula", op.is_formula);
    auto ms = std::int64_t{0};
    read_optional(j, "timestamp_ms", ms);
    op.timestamp = from_epoch_ms(ms);
}

void to_json(nlohmann::json& j, const ForkInfo& info) {
    j = nlohmann::json{
        {"fork_id", info.fork_id},
        {"workbook_id", info.workbook_id},
        {"base_path", info.base_path.string()},
        {"work_path", info.work_path.string()},
        {"version", info.version},
        {"created_at_ms", to_epoch_ms(info.created_at)},
        {"edit_count", info.edit_count},
        {"checkpoint_count", info.checkpoint_count},
    };
}

void to_json(nlohmann::json& j, const CheckpointInfo& info) {
    j = nlohmann::json{
        {"checkpoint_id", info.checkpoint_id},
        {"fork_id", info.fork_id},
        {"snapshot_path", info.snapshot_path.string()},
        {"fork_version", info.fork_version},
        {"crc32", info.crc32},
        {"size_bytes", info.size_bytes},
        {"created_at_ms", to_epoch_ms(info.created_at)},
    };
    if (info.label) j["label"] = *info.label;
}

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"operations", stats.operations},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"size", stats.size},
        {"capacity", stats.capacity},
        {"hit_rate", stats.hit_rate()},
    };
}

void to_json(nlohmann::json& j, const CacheWarmingResult& result) {
    j = nlohmann::json{
        {"loaded", result.loaded},
        {"failed", result.failed},
        {"duration_ms", result.duration.count()},
        {"errors", result.errors},
    };
}

void to_json(nlohmann::json& j, const RecalcResult& result) {
    j = nlohmann::json{
        {"fork_id", result.fork_id},
        {"success", result.success},
        {"duration_ms", result.duration.count()},
        {"message", result.message},
    };
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const ForkConfig& c) {
    j = nlohmann::json{
        {"fork_dir", c.fork_dir.string()},
        {"workspace_root", c.workspace_root.string()},
        {"ttl_secs", c.ttl.count()},
        {"max_forks", c.max_forks},
        {"max_file_size", c.max_file_size},
        {"max_checkpoints_per_fork", c.max_checkpoints_per_fork},
        {"cleanup_interval_secs", c.cleanup_interval.count()},
        {"max_concurrent_recalcs", c.max_concurrent_recalcs},
        {"lock_timeout_ms", c.lock_timeout.count()},
        {"supported_extensions", c.supported_extensions},
    };
}

void from_json(const nlohmann::json& j, ForkConfig& c) {
    read_path(j, "fork_dir", c.fork_dir);
    read_path(j, "workspace_root", c.workspace_root);
    read_duration(j, "ttl_secs", c.ttl);
    read_optional(j, "max_forks", c.max_forks);
    read_optional(j, "max_file_size", c.max_file_size);
    read_optional(j, "max_checkpoints_per_fork", c.max_checkpoints_per_fork);
    read_duration(j, "cleanup_interval_secs", c.cleanup_interval);
    read_optional(j, "max_concurrent_recalcs", c.max_concurrent_recalcs);
    read_duration(j, "lock_timeout_ms", c.lock_timeout);
    read_optional(j, "supported_extensions", c.supported_extensions);
}

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{
        {"capacity", c.capacity},
        {"workspace_root", c.workspace_root.string()},
        {"supported_extensions", c.supported_extensions},
    };
}

void from_json(const nlohmann::json& j, CacheConfig& c) {
    read_optional(j, "capacity", c.capacity);
    read_path(j, "workspace_root", c.workspace_root);
    read_optional(j, "supported_extensions", c.supported_extensions);
}

void to_json(nlohmann::json& j, const CacheWarmingConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"max_workbooks", c.max_workbooks},
        {"timeout_secs", c.timeout.count()},
        {"workbook_ids", c.workbook_ids},
    };
}

void from_json(const nlohmann::json& j, CacheWarmingConfig& c) {
    read_optional(j, "enabled", c.enabled);
    read_optional(j, "max_workbooks", c.max_workbooks);
    read_duration(j, "timeout_secs", c.timeout);
    read_optional(j, "workbook_ids", c.workbook_ids);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"workspace_root", c.workspace_root.string()},
        {"cache", c.cache},
        {"forks", c.forks},
        {"warming", c.warming},
        {"log_level", c.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    read_path(j, "workspace_root", c.workspace_root);
    read_optional(j, "cache", c.cache);
    read_optional(j, "forks", c.forks);
    read_optional(j, "warming", c.warming);
    read_optional(j, "log_level", c.log_level);
}

}  // namespace sheetfork_cpp
