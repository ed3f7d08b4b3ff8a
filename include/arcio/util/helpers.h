#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace arcio::util {

// Grows |bytes| with zero bytes or truncates it to exactly |count| elements.
void SetSize(std::vector<uint8_t>& bytes, size_t count);

template <class Range, class Fn>
void ForEach(Range&& items, Fn&& action) {
  for (auto&& item : items) {
    action(item);
  }
}

// Single-element sequence wrapping |item|.
template <class T>
[[nodiscard]] std::array<std::decay_t<T>, 1> AsEnumerable(T&& item) {
  return {std::forward<T>(item)};
}

template <class T>
[[nodiscard]] std::span<const T> ToReadOnly(const std::vector<T>& items) noexcept {
  return std::span<const T>(items.data(), items.size());
}

// Logical right shift of a signed value: vacated high bits are zero-filled.
// Only the low five (32-bit) or six (64-bit) bits of |bits| are used, so a
// shift by the full width returns |number| unchanged.
[[nodiscard]] constexpr int32_t URShift(int32_t number, int bits) noexcept {
  return static_cast<int32_t>(static_cast<uint32_t>(number) >> (bits & 31));
}

[[nodiscard]] constexpr int64_t URShift(int64_t number, int bits) noexcept {
  return static_cast<int64_t>(static_cast<uint64_t>(number) >> (bits & 63));
}

// Replaces NUL bytes with spaces and trims surrounding whitespace; used for
// fixed-width, NUL-padded name fields in archive headers.
[[nodiscard]] std::string TrimNulls(std::string_view source);

}  // namespace arcio::util
