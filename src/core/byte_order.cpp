#include "arcio/core/byte_order.h"

#include <string>

#include "arcio/errors.h"

namespace arcio::core {
namespace {

void RequireWritable(std::span<uint8_t> buffer, size_t offset, size_t width) {
  if (!RangeFits(buffer.size(), offset, width)) {
    ThrowOutOfRange(std::string(errors::msg::kByteOrderWriteOutOfRange) + " (offset " +
                    std::to_string(offset) + ", width " + std::to_string(width) + ", size " +
                    std::to_string(buffer.size()) + ")");
  }
}

void RequireReadable(std::span<const uint8_t> buffer, size_t offset, size_t width) {
  if (!RangeFits(buffer.size(), offset, width)) {
    ThrowOutOfRange(std::string(errors::msg::kByteOrderReadOutOfRange) + " (offset " +
                    std::to_string(offset) + ", width " + std::to_string(width) + ", size " +
                    std::to_string(buffer.size()) + ")");
  }
}

template <class T>
void StoreLittle(std::span<uint8_t> buffer, T value, size_t offset) {
  RequireWritable(buffer, offset, sizeof(T));
  for (size_t i = 0; i < sizeof(T); ++i) {
    buffer[offset + i] = static_cast<uint8_t>(value >> (8U * i));
  }
}

template <class T>
void StoreBig(std::span<uint8_t> buffer, T value, size_t offset) {
  RequireWritable(buffer, offset, sizeof(T));
  for (size_t i = 0; i < sizeof(T); ++i) {
    buffer[offset + i] = static_cast<uint8_t>(value >> (8U * (sizeof(T) - 1U - i)));
  }
}

template <class T>
T LoadLittle(std::span<const uint8_t> buffer, size_t offset) {
  RequireReadable(buffer, offset, sizeof(T));
  T value = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<T>(static_cast<T>(buffer[offset + i]) << (8U * i));
  }
  return value;
}

template <class T>
T LoadBig(std::span<const uint8_t> buffer, size_t offset) {
  RequireReadable(buffer, offset, sizeof(T));
  T value = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    value = static_cast<T>((value << 8U) | buffer[offset + i]);
  }
  return value;
}

}  // namespace

void WriteLittleEndianU16(std::span<uint8_t> buffer, uint16_t value, size_t offset) {
  StoreLittle(buffer, value, offset);
}

void WriteLittleEndianU32(std::span<uint8_t> buffer, uint32_t value, size_t offset) {
  StoreLittle(buffer, value, offset);
}

void WriteLittleEndianU64(std::span<uint8_t> buffer, uint64_t value, size_t offset) {
  StoreLittle(buffer, value, offset);
}

void WriteBigEndianU16(std::span<uint8_t> buffer, uint16_t value, size_t offset) {
  StoreBig(buffer, value, offset);
}

void WriteBigEndianU32(std::span<uint8_t> buffer, uint32_t value, size_t offset) {
  StoreBig(buffer, value, offset);
}

void WriteBigEndianU64(std::span<uint8_t> buffer, uint64_t value, size_t offset) {
  StoreBig(buffer, value, offset);
}

uint16_t ReadLittleEndianU16(std::span<const uint8_t> buffer, size_t offset) {
  return LoadLittle<uint16_t>(buffer, offset);
}

uint32_t ReadLittleEndianU32(std::span<const uint8_t> buffer, size_t offset) {
  return LoadLittle<uint32_t>(buffer, offset);
}

uint64_t ReadLittleEndianU64(std::span<const uint8_t> buffer, size_t offset) {
  return LoadLittle<uint64_t>(buffer, offset);
}

uint16_t ReadBigEndianU16(std::span<const uint8_t> buffer, size_t offset) {
  return LoadBig<uint16_t>(buffer, offset);
}

uint32_t ReadBigEndianU32(std::span<const uint8_t> buffer, size_t offset) {
  return LoadBig<uint32_t>(buffer, offset);
}

uint64_t ReadBigEndianU64(std::span<const uint8_t> buffer, size_t offset) {
  return LoadBig<uint64_t>(buffer, offset);
}

}  // namespace arcio::core
