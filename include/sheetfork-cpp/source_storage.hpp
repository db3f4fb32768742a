/// @file source_storage.hpp
/// @brief Where fork working copies come from.

#pragma once

#include <filesystem>

namespace sheetfork_cpp {

/// Supplies a copy of a source workbook.
class SourceStorage {
public:
    virtual ~SourceStorage() = default;

    /// Copy `source` to `destination`, creating or replacing it.
    /// @throws EngineError (io_failure) on failure.
    virtual void copy_to(const std::filesystem::path& source,
                         const std::filesystem::path& destination) = 0;
};

/// Copies through std::filesystem on the local disk.
class FilesystemStorage final : public SourceStorage {
public:
    void copy_to(const std::filesystem::path& source,
                 const std::filesystem::path& destination) override;
};

}  // namespace sheetfork_cpp
