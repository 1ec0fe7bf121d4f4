#pragma once

#include "acedaw/store/KeyValueStore.hpp"

#include <map>
#include <mutex>

namespace acedaw::store {

class MemoryKeyValueStore : public KeyValueStore {
public:
    MemoryKeyValueStore() = default;

    std::expected<std::optional<std::vector<uint8_t>>, std::string> get(std::string_view key) const override;
    std::expected<void, std::string> set(std::string_view key, std::span<const uint8_t> value) override;
    std::expected<void, std::string> remove(std::string_view key) override;
    std::expected<std::vector<std::string>, std::string> listKeys() const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>, std::less<>> entries_;
};

}  // namespace acedaw::store
