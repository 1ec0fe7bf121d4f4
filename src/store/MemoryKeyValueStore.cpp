#include "acedaw/store/MemoryKeyValueStore.hpp"

namespace acedaw::store {

std::expected<std::optional<std::vector<uint8_t>>, std::string> MemoryKeyValueStore::get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::vector<uint8_t>>{};
    }
    return std::optional<std::vector<uint8_t>>{it->second};
}

std::expected<void, std::string> MemoryKeyValueStore::set(std::string_view key, std::span<const uint8_t> value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(std::string(key), std::vector<uint8_t>(value.begin(), value.end()));
    return {};
}

std::expected<void, std::string> MemoryKeyValueStore::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        entries_.erase(it);
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> MemoryKeyValueStore::listKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

size_t MemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace acedaw::store
