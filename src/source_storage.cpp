#include <sheetfork-cpp/source_storage.hpp>

#include "fs_util.hpp"

namespace sheetfork_cpp {

void FilesystemStorage::copy_to(const std::filesystem::path& source,
                                const std::filesystem::path& destination) {
    detail::copy_file(source, destination, "copy_source");
}

}  // namespace sheetfork_cpp
