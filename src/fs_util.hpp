#pragma once

// Filesystem helpers shared by the registry and the cache: checksums,
// fingerprints, workbook id derivation and logged best-effort removal.
//
// Internal header -- not installed.

#include <sheetfork-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sheetfork_cpp::detail {

/// CRC-32 of a file's contents, streamed in fixed-size blocks.
/// @throws EngineError (io_failure) if the file cannot be read.
auto file_crc32(const std::filesystem::path& path, std::string_view operation) -> std::uint32_t;

/// Fingerprint a file.
/// @throws EngineError (not_found) if missing, (io_failure) if unreadable.
auto fingerprint(const std::filesystem::path& path, std::string_view operation) -> FileFingerprint;

/// Derive a stable "wb-XXXXXXXXXX" id from a path, its size and mtime.
auto derive_workbook_id(const std::filesystem::path& path,
                        std::uintmax_t size,
                        std::filesystem::file_time_type modified) -> WorkbookId;

/// Derive the id for an existing file. Returns an empty id on I/O error.
auto derive_workbook_id(const std::filesystem::path& path) -> WorkbookId;

/// Copy `from` over `to`.
/// @throws EngineError (io_failure) with the error_code message.
void copy_file(const std::filesystem::path& from, const std::filesystem::path& to,
               std::string_view operation);

/// Rename `from` onto `to`, replacing it.
/// @throws EngineError (io_failure) with the error_code message.
void replace_file(const std::filesystem::path& from, const std::filesystem::path& to,
                  std::string_view operation);

/// Log an aborted cleanup. A logger that throws is ignored.
void log_cleanup_failure(std::string_view context, const char* what) noexcept;

/// Remove a file if it exists. Failures are logged, never thrown.
/// @return false if the file existed and could not be removed.
auto remove_quietly(const std::filesystem::path& path, std::string_view context) noexcept -> bool;

/// Remove a directory tree if it exists. Failures are logged, never thrown.
auto remove_tree_quietly(const std::filesystem::path& path, std::string_view context) noexcept -> bool;

/// `count` random lowercase hex characters.
auto random_hex(std::size_t count) -> std::string;

/// Lower-case an ASCII string.
auto ascii_lower(std::string_view s) -> std::string;

}  // namespace sheetfork_cpp::detail
