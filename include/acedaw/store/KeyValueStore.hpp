#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::store {

/// Persistent key-value substrate the project and audio stores are built on.
/// A value written with set() stays readable until remove() is called for its key.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// Returns std::nullopt when no value is stored under key.
    virtual std::expected<std::optional<std::vector<uint8_t>>, std::string> get(std::string_view key) const = 0;

    virtual std::expected<void, std::string> set(std::string_view key, std::span<const uint8_t> value) = 0;

    /// Removing a missing key succeeds.
    virtual std::expected<void, std::string> remove(std::string_view key) = 0;

    /// All stored keys, in no particular order.
    virtual std::expected<std::vector<std::string>, std::string> listKeys() const = 0;
};

}  // namespace acedaw::store
