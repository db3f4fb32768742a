// basic_usage -- demonstrates the core sheetfork-cpp API
//
// Opens a workbook through the cache, forks it, applies versioned edits,
// takes and restores a checkpoint, and saves the result next to the
// original.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <sheetfork-cpp/sheetfork.hpp>

#include <sheetfork-cpp/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

namespace sf = sheetfork_cpp;

namespace {

// Stands in for a real spreadsheet parser: keeps the raw bytes.
struct RawWorkbook : sf::ParsedWorkbook {
    std::string bytes;
};

auto load_raw(const sf::WorkbookId&, const std::filesystem::path& path) -> sf::WorkbookHandle {
    auto in = std::ifstream{path, std::ios::binary};
    auto wb = std::make_shared<RawWorkbook>();
    wb->bytes.assign(std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{});
    return wb;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    out << text;
}

}  // namespace

int main() {
    auto root = std::filesystem::temp_directory_path() / "sheetfork-basic-usage";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "models");
    auto model = root / "models" / "forecast.xlsx";
    write_text(model, "forecast: revenue=100");

    auto config = sf::EngineConfig{};
    config.workspace_root = root / "models";
    config.forks.fork_dir = root / "forks";
    config.cache.capacity = 4;

    try {
        auto ws = sf::Workspace{config, load_raw};

        // -- Open through the cache -------------------------------------------
        auto handle = ws.open_workbook(model.string());
        auto fork = ws.create_fork(model.string());
        std::printf("fork %s at version %llu\n", fork.str().c_str(),
                    static_cast<unsigned long long>(ws.registry().get_version(fork)));

        // -- Versioned edits --------------------------------------------------
        auto v = ws.registry().get_version(fork);
        v = ws.with_fork_mut_versioned(fork, v, [](sf::ForkTransaction& tx) {
            write_text(tx.work_path(), "forecast: revenue=120");
            tx.record_edit("Inputs", "B2", "120");
            return tx.base_version() + 1;
        });

        // A stale version is refused without running the mutator.
        try {
            ws.with_fork_mut_versioned(fork, 0, [](sf::ForkTransaction&) {});
        } catch (const sf::EngineError& e) {
            std::printf("stale write refused: %s\n", nlohmann::json(e.error()).dump().c_str());
        }

        // -- Checkpoints ------------------------------------------------------
        auto cp = ws.checkpoint_fork(fork, "revenue 120");
        ws.with_fork_mut_versioned(fork, v, [](sf::ForkTransaction& tx) {
            write_text(tx.work_path(), "forecast: revenue=-1");
            tx.record_edit("Inputs", "B2", "-1");
        });
        v = ws.restore_checkpoint(fork, v + 1, cp.checkpoint_id);
        std::printf("restored %s, fork now at version %llu\n", cp.checkpoint_id.c_str(),
                    static_cast<unsigned long long>(v));

        // -- Save -------------------------------------------------------------
        auto target = root / "models" / "forecast-v2.xlsx";
        ws.save_fork(fork, target);
        auto saved = ws.open_workbook(target.string());
        std::printf("saved: %s\n", static_cast<const RawWorkbook&>(*saved).bytes.c_str());
        std::printf("original: %s\n", static_cast<const RawWorkbook&>(*handle).bytes.c_str());
        std::printf("cache: %s\n", nlohmann::json(ws.cache_stats()).dump().c_str());
    } catch (const sf::EngineError& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }

    std::filesystem::remove_all(root);
    return 0;
}
