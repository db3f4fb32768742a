#include <sheetfork-cpp/recalc_lock_table.hpp>

namespace sheetfork_cpp {

auto RecalcLockTable::acquire(const std::string& key) -> std::shared_ptr<std::mutex> {
    {
        auto lock = std::shared_lock{mutex_};
        if (auto it = locks_.find(key); it != locks_.end()) return it->second;
    }
    auto lock = std::unique_lock{mutex_};
    auto [it, inserted] = locks_.try_emplace(key, nullptr);
    if (inserted) it->second = std::make_shared<std::mutex>();
    return it->second;
}

auto RecalcLockTable::release(const std::string& key) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto it = locks_.find(key);
    if (it == locks_.end()) return false;
    // New references are only handed out under this table lock, so a count
    // of one cannot grow while we hold it exclusively.
    if (it->second.use_count() > 1) return false;
    locks_.erase(it);
    return true;
}

void RecalcLockTable::erase(const std::string& key) {
    auto lock = std::unique_lock{mutex_};
    locks_.erase(key);
}

auto RecalcLockTable::contains(const std::string& key) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return locks_.contains(key);
}

auto RecalcLockTable::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return locks_.size();
}

auto RecalcLockTable::holders(const std::string& key) const -> long {
    auto lock = std::shared_lock{mutex_};
    auto it = locks_.find(key);
    if (it == locks_.end()) return 0;
    return it->second.use_count() - 1;
}

auto RecalcLockTable::unreferenced_keys() const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto out = std::vector<std::string>{};
    for (const auto& [key, mtx] : locks_) {
        if (mtx.use_count() == 1) out.push_back(key);
    }
    return out;
}

auto RecalcLockTable::keys() const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto out = std::vector<std::string>{};
    out.reserve(locks_.size());
    for (const auto& [key, mtx] : locks_) out.push_back(key);
    return out;
}

}  // namespace sheetfork_cpp
