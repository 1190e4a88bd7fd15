/// @file id.cpp
/// @brief UUID generation for pulse_core

#include <pulse/core/id.hpp>

#include <array>
#include <cstdint>
#include <random>

namespace pulse_core {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

constexpr char k_hex_digits[] = "0123456789abcdef";

} // anonymous namespace

std::string generate_uuid() {
    std::array<std::uint8_t, 16> bytes{};
    auto& rng = thread_rng();
    std::uint64_t hi = rng();
    std::uint64_t lo = rng();
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(hi >> (i * 8));
        bytes[i + 8] = static_cast<std::uint8_t>(lo >> (i * 8));
    }

    // Version 4, variant 10xx
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(k_hex_digits[bytes[i] >> 4]);
        out.push_back(k_hex_digits[bytes[i] & 0x0F]);
    }
    return out;
}

bool is_uuid_v4(const std::string& str) noexcept {
    if (str.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
            continue;
        }
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    if (str[14] != '4') {
        return false;
    }
    char variant = str[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace pulse_core
