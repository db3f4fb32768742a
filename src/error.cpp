#include <sheetfork-cpp/error.hpp>

#include <fmt/format.h>

namespace sheetfork_cpp {

auto Error::describe() const -> std::string {
    if (operation.empty()) {
        return fmt::format("{}: {}", to_string_view(kind), message);
    }
    return fmt::format("{}({}): {}: {}", operation, subject, to_string_view(kind), message);
}

EngineError::EngineError(Error error)
    : std::runtime_error{error.describe()}, error_{std::move(error)} {}

auto not_found(std::string_view operation, std::string_view subject) -> EngineError {
    return EngineError{Error{ErrorKind::not_found,
                             fmt::format("no such id: {}", subject),
                             std::string{operation}, std::string{subject}}};
}

auto version_conflict(std::string_view operation, std::string_view fork_id,
                      std::uint64_t expected, std::uint64_t current) -> EngineError {
    auto error = Error{ErrorKind::version_conflict,
                       fmt::format("expected version {}, current version is {}", expected, current),
                       std::string{operation}, std::string{fork_id}};
    error.expected_version = expected;
    error.current_version = current;
    return EngineError{std::move(error)};
}

auto io_failure(std::string_view operation, std::string_view subject,
                std::string_view detail) -> EngineError {
    return EngineError{Error{ErrorKind::io_failure, std::string{detail},
                             std::string{operation}, std::string{subject}}};
}

auto make_error(ErrorKind kind, std::string_view operation, std::string_view subject,
                std::string message) -> EngineError {
    return EngineError{Error{kind, std::move(message),
                             std::string{operation}, std::string{subject}}};
}

}  // namespace sheetfork_cpp
