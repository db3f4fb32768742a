/// @file error.hpp
/// @brief Error types for the sheetfork-cpp library.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sheetfork_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_found,                     ///< Unknown fork, workbook or checkpoint id.
    version_conflict,              ///< Optimistic version check failed.
    io_failure,                    ///< A filesystem copy, rename or delete failed.
    lock_table_corruption,         ///< Recalc lock table disagrees with the registry.
    cache_capacity_misconfigured,  ///< The cache was configured with zero capacity.
    invalid_argument,              ///< A path, extension or size was rejected.
    limit_exceeded,                ///< The fork limit was reached.
    base_modified,                 ///< The fork's source changed since creation.
    checkpoint_invalid,            ///< A checkpoint snapshot failed its integrity check.
    lock_timeout,                  ///< A fork's exclusive intent could not be acquired in time.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:                    return "not_found";
        case ErrorKind::version_conflict:             return "version_conflict";
        case ErrorKind::io_failure:                   return "io_failure";
        case ErrorKind::lock_table_corruption:        return "lock_table_corruption";
        case ErrorKind::cache_capacity_misconfigured: return "cache_capacity_misconfigured";
        case ErrorKind::invalid_argument:             return "invalid_argument";
        case ErrorKind::limit_exceeded:               return "limit_exceeded";
        case ErrorKind::base_modified:                return "base_modified";
        case ErrorKind::checkpoint_invalid:           return "checkpoint_invalid";
        case ErrorKind::lock_timeout:                 return "lock_timeout";
    }
    return "unknown";
}

/// True for errors a caller can resolve by re-reading and retrying.
constexpr auto is_retryable(ErrorKind kind) noexcept -> bool {
    return kind == ErrorKind::version_conflict || kind == ErrorKind::lock_timeout;
}

/// A structured error with a category, a human-readable message, and
/// enough context (operation, subject, versions) to construct a retry.
struct Error {
    ErrorKind kind;                                 ///< The category of this error.
    std::string message;                            ///< A human-readable description.
    std::string operation{};                        ///< The operation that failed.
    std::string subject{};                          ///< Fork id, workbook id or path.
    std::optional<std::uint64_t> expected_version{};  ///< Version the caller expected.
    std::optional<std::uint64_t> current_version{};   ///< Live version at failure time.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct an Error with operation and subject context.
    Error(ErrorKind k, std::string msg, std::string op, std::string subj)
        : kind{k}, message{std::move(msg)},
          operation{std::move(op)}, subject{std::move(subj)} {}

    auto operator==(const Error& other) const -> bool = default;

    /// Render as "operation(subject): kind: message".
    auto describe() const -> std::string;
};

/// Exception carrying an Error out of a failed operation.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(Error error);

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

// -- Factories ----------------------------------------------------------------

/// An unknown fork, workbook or checkpoint id.
auto not_found(std::string_view operation, std::string_view subject) -> EngineError;

/// An optimistic version check failure.
auto version_conflict(std::string_view operation, std::string_view fork_id,
                      std::uint64_t expected, std::uint64_t current) -> EngineError;

/// A filesystem failure; `detail` is usually an error_code message.
auto io_failure(std::string_view operation, std::string_view subject,
                std::string_view detail) -> EngineError;

/// Any other kind, with a free-form message.
auto make_error(ErrorKind kind, std::string_view operation, std::string_view subject,
                std::string message) -> EngineError;

}  // namespace sheetfork_cpp
