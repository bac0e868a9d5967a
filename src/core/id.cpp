#include "esflow/core/id.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace esflow {

namespace {

std::mt19937_64& id_engine() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device device;
        std::seed_seq seq{device(), device(), device(), device()};
        return std::mt19937_64(seq);
    }()};
    return engine;
}

} // namespace

std::string generate_id() {
    std::array<std::uint8_t, 16> bytes{};
    auto& engine = id_engine();
    std::uint64_t hi = engine();
    std::uint64_t lo = engine();
    for (int i = 0; i < 8; i++) {
        bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace esflow
