#pragma once

// Checked fixed-width integer packing

#include <cstddef>
#include <cstdint>
#include <span>

#include "arcio/common.h"
#include "arcio/error.h"

namespace arcio::core {

// All writers and readers validate |offset| + width <= buffer.size() before
// touching memory and throw arcio::Error (Validation / kOutOfRange) otherwise.
// A failed call leaves the buffer unchanged.

void WriteLittleEndianU16(std::span<uint8_t> buffer, uint16_t value, size_t offset);
void WriteLittleEndianU32(std::span<uint8_t> buffer, uint32_t value, size_t offset);
void WriteLittleEndianU64(std::span<uint8_t> buffer, uint64_t value, size_t offset);

void WriteBigEndianU16(std::span<uint8_t> buffer, uint16_t value, size_t offset);
void WriteBigEndianU32(std::span<uint8_t> buffer, uint32_t value, size_t offset);
void WriteBigEndianU64(std::span<uint8_t> buffer, uint64_t value, size_t offset);

[[nodiscard]] uint16_t ReadLittleEndianU16(std::span<const uint8_t> buffer, size_t offset);
[[nodiscard]] uint32_t ReadLittleEndianU32(std::span<const uint8_t> buffer, size_t offset);
[[nodiscard]] uint64_t ReadLittleEndianU64(std::span<const uint8_t> buffer, size_t offset);

[[nodiscard]] uint16_t ReadBigEndianU16(std::span<const uint8_t> buffer, size_t offset);
[[nodiscard]] uint32_t ReadBigEndianU32(std::span<const uint8_t> buffer, size_t offset);
[[nodiscard]] uint64_t ReadBigEndianU64(std::span<const uint8_t> buffer, size_t offset);

// True when [offset, offset + width) lies inside a buffer of |size| bytes.
[[nodiscard]] constexpr bool RangeFits(size_t size, size_t offset, size_t width) noexcept {
  return offset <= size && width <= size - offset;
}

}  // namespace arcio::core
