/// @file types.hpp
/// @brief Core identity and record types: WorkbookId, ForkId, Version,
/// FileFingerprint, EditOp, ForkInfo, CheckpointInfo.

#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sheetfork_cpp {

/// Monotonic per-fork version stamp. Starts at 0.
using Version = std::uint64_t;

/// Wall-clock timestamps reported to callers.
using Clock = std::chrono::system_clock;

/// Opaque identifier for a source workbook.
///
/// Ids derived from a file are "wb-" followed by ten base32 characters;
/// the part after the prefix is the workbook's short id.
struct WorkbookId {
    std::string value;

    WorkbookId() = default;
    explicit WorkbookId(std::string v) : value{std::move(v)} {}

    auto str() const -> const std::string& { return value; }
    auto empty() const -> bool { return value.empty(); }

    /// The id without its "wb-" prefix.
    auto short_id() const -> std::string {
        constexpr auto prefix = std::string_view{"wb-"};
        if (std::string_view{value}.starts_with(prefix)) return value.substr(prefix.size());
        return value;
    }

    auto operator<=>(const WorkbookId&) const = default;
    auto operator==(const WorkbookId&) const -> bool = default;
};

/// Opaque identifier for a fork. Never reused within a process lifetime.
struct ForkId {
    std::string value;

    ForkId() = default;
    explicit ForkId(std::string v) : value{std::move(v)} {}

    auto str() const -> const std::string& { return value; }
    auto empty() const -> bool { return value.empty(); }

    auto operator<=>(const ForkId&) const = default;
    auto operator==(const ForkId&) const -> bool = default;
};

/// Size, modification time and CRC-32 of a file at one point in time.
struct FileFingerprint {
    std::uintmax_t size{0};
    std::filesystem::file_time_type modified{};
    std::uint32_t crc32{0};

    auto operator==(const FileFingerprint&) const -> bool = default;
};

/// A single cell edit recorded against a fork.
struct EditOp {
    Clock::time_point timestamp{};
    std::string sheet;
    std::string address;
    std::string value;
    bool is_formula{false};

    auto operator==(const EditOp&) const -> bool = default;
};

/// A restorable snapshot of a fork's working copy.
struct CheckpointInfo {
    std::string checkpoint_id;
    ForkId fork_id;
    std::optional<std::string> label;
    std::filesystem::path snapshot_path;
    Version fork_version{0};        ///< Fork version when the snapshot was taken.
    std::uint32_t crc32{0};         ///< CRC-32 of the snapshot contents.
    std::uintmax_t size_bytes{0};
    Clock::time_point created_at{};

    auto operator==(const CheckpointInfo&) const -> bool = default;
};

/// Point-in-time summary of a fork, as returned by list_forks().
struct ForkInfo {
    ForkId fork_id;
    WorkbookId workbook_id;
    std::filesystem::path base_path;
    std::filesystem::path work_path;
    Version version{0};
    Clock::time_point created_at{};
    std::size_t edit_count{0};
    std::size_t checkpoint_count{0};

    auto operator==(const ForkInfo&) const -> bool = default;
};

}  // namespace sheetfork_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<sheetfork_cpp::WorkbookId> {
    auto operator()(const sheetfork_cpp::WorkbookId& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

template <>
struct std::hash<sheetfork_cpp::ForkId> {
    auto operator()(const sheetfork_cpp::ForkId& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

/// @endcond
