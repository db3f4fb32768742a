#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/json.hpp>

#include "fs_util.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sheetfork_cpp {

void EngineConfig::propagate_workspace_root() {
    if (cache.workspace_root.empty()) cache.workspace_root = workspace_root;
    if (forks.workspace_root.empty()) forks.workspace_root = workspace_root;
}

auto has_supported_extension(const std::filesystem::path& path,
                             const std::vector<std::string>& extensions) -> bool {
    auto ext = path.extension().string();
    if (ext.empty()) return false;
    ext = detail::ascii_lower(ext.substr(1));
    return std::ranges::any_of(extensions, [&](const std::string& candidate) {
        return detail::ascii_lower(candidate) == ext;
    });
}

auto parse_config(std::string_view json_text) -> EngineConfig {
    try {
        auto j = nlohmann::json::parse(json_text);
        auto config = j.get<EngineConfig>();
        config.propagate_workspace_root();
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw make_error(ErrorKind::invalid_argument, "parse_config", "<json>", e.what());
    }
}

auto load_config(const std::filesystem::path& path) -> EngineConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw io_failure("load_config", path.string(), "cannot open configuration file");
    }
    auto buffer = std::stringstream{};
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace sheetfork_cpp
