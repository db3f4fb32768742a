// concurrent_forks -- many clients editing forks of one workbook
//
// Demonstrates: optimistic concurrency with retry on version_conflict,
// recalculations serialized per fork but parallel across forks, and the
// background TTL sweep.
//
// Build: cmake --build build
// Run:   ./build/examples/concurrent_forks

#include <sheetfork-cpp/sheetfork.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sf = sheetfork_cpp;
using namespace std::chrono_literals;

namespace {

// Pretends to recalculate by sleeping; reports how many ran at once.
class SleepyBackend final : public sf::RecalcBackend {
public:
    auto recalculate(const std::filesystem::path&) -> sf::RecalcResult override {
        auto now = inside_.fetch_add(1) + 1;
        auto prev = peak_.load();
        while (prev < now && !peak_.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(50ms);
        inside_.fetch_sub(1);
        return sf::RecalcResult{.success = true, .message = "ok"};
    }

    auto peak() const -> int { return peak_.load(); }

private:
    std::atomic<int> inside_{0};
    std::atomic<int> peak_{0};
};

}  // namespace

int main() {
    auto root = std::filesystem::temp_directory_path() / "sheetfork-concurrent-forks";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "models");
    auto model = root / "models" / "budget.xlsx";
    {
        auto out = std::ofstream{model, std::ios::binary};
        out << "budget";
    }

    auto config = sf::ForkConfig{
        .fork_dir = root / "forks",
        .workspace_root = root / "models",
        .max_forks = 16,
        .max_concurrent_recalcs = 4,
    };
    auto registry = sf::ForkRegistry{config};
    registry.start_cleanup_task();

    // =========================================================================
    // Scenario 1: 8 writers on one fork, retrying on conflict
    // =========================================================================
    std::printf("=== Scenario 1: 8 writers, 50 edits each ===\n");
    auto shared = registry.create_fork(sf::WorkbookId{"wb-budgetbudg"}, model);
    auto retries = std::atomic<int>{0};
    {
        auto writers = std::vector<std::jthread>{};
        for (int w = 0; w < 8; ++w) {
            writers.emplace_back([&, w] {
                for (int i = 0; i < 50; ++i) {
                    while (true) {
                        auto v = registry.get_version(shared);
                        try {
                            registry.with_fork_mut_versioned(shared, v, [&](sf::ForkTransaction& tx) {
                                tx.record_edit("Ledger", "A" + std::to_string(w + 1),
                                               std::to_string(i));
                            });
                            break;
                        } catch (const sf::EngineError& e) {
                            if (!sf::is_retryable(e.kind())) throw;
                            retries.fetch_add(1);
                        }
                    }
                }
            });
        }
    }
    std::printf("final version %llu after %d retries\n",
                static_cast<unsigned long long>(registry.get_version(shared)), retries.load());

    // =========================================================================
    // Scenario 2: recalculating four forks at once
    // =========================================================================
    std::printf("\n=== Scenario 2: recalculate_many over 4 forks ===\n");
    auto ids = std::vector<sf::ForkId>{};
    for (int i = 0; i < 4; ++i) ids.push_back(registry.create_fork(sf::WorkbookId{"wb-budgetbudg"}, model));
    auto backend = SleepyBackend{};
    auto start = std::chrono::steady_clock::now();
    auto results = registry.recalculate_many(ids, backend);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::printf("%zu results in %lld ms, peak parallelism %d\n", results.size(),
                static_cast<long long>(elapsed.count()), backend.peak());

    // =========================================================================
    // Scenario 3: cleanup
    // =========================================================================
    std::printf("\n=== Scenario 3: cleanup ===\n");
    for (const auto& id : ids) registry.discard_fork(id);
    registry.discard_fork(shared);
    registry.verify_lock_table();
    std::printf("forks=%zu lock entries=%zu\n", registry.fork_count(), registry.recalc_lock_count());

    std::filesystem::remove_all(root);
    return 0;
}
