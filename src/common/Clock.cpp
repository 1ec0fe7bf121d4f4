#include "acedaw/common/Clock.hpp"

#include <array>
#include <chrono>
#include <mutex>
#include <random>

namespace acedaw::common {

int64_t currentEpochMillis() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::string generateUuid() {
    static std::mutex generatorMutex;
    static std::mt19937_64 generator{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    {
        std::lock_guard<std::mutex> lock(generatorMutex);
        for (size_t i = 0; i < bytes.size(); i += 8u) {
            const uint64_t word = generator();
            for (size_t b = 0; b < 8u; ++b) {
                bytes[i + b] = static_cast<uint8_t>((word >> (b * 8u)) & 0xFFu);
            }
        }
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0Fu) | 0x40u);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3Fu) | 0x80u);  // RFC 4122 variant

    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[(bytes[i] >> 4u) & 0x0Fu]);
        out.push_back(kHexDigits[bytes[i] & 0x0Fu]);
    }
    return out;
}

}  // namespace acedaw::common
