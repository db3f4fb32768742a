/// @file recalc.hpp
/// @brief Interface to the external recalculation engine.

#pragma once

#include <sheetfork-cpp/types.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace sheetfork_cpp {

/// Outcome of recalculating one fork's working copy.
struct RecalcResult {
    ForkId fork_id{};
    bool success{false};
    std::chrono::milliseconds duration{0};
    std::string message{};

    auto operator==(const RecalcResult&) const -> bool = default;
};

/// An external engine that recomputes formula results in a working copy.
///
/// The engine is assumed non-reentrant on a given file; ForkRegistry
/// serializes calls per fork and caps the number of concurrent calls
/// across forks. Implementations update the file in place and report the
/// outcome; fork_id and duration are filled in by the registry.
class RecalcBackend {
public:
    virtual ~RecalcBackend() = default;

    /// Recalculate `work_path` synchronously.
    virtual auto recalculate(const std::filesystem::path& work_path) -> RecalcResult = 0;

    /// False if the engine is not installed or not usable.
    virtual auto is_available() const -> bool { return true; }
};

}  // namespace sheetfork_cpp
