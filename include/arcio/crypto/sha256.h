#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace arcio::crypto {
std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t, 32> SHA256_Hash(std::string_view text);
} // namespace arcio::crypto
