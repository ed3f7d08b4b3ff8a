#include "arcio/util/helpers.h"

#include <algorithm>
#include <cctype>

namespace arcio::util {

void SetSize(std::vector<uint8_t>& bytes, size_t count) {
  if (count > bytes.size()) {
    bytes.reserve(count);
    bytes.resize(count, 0x0);
  } else {
    bytes.erase(bytes.begin() + static_cast<std::ptrdiff_t>(count), bytes.end());
  }
}

std::string TrimNulls(std::string_view source) {
  std::string out(source);
  std::replace(out.begin(), out.end(), '\0', ' ');
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  const auto first = std::find_if_not(out.begin(), out.end(), is_space);
  if (first == out.end()) {
    return std::string{};
  }
  const auto last = std::find_if_not(out.rbegin(), out.rend(), is_space).base();
  return std::string(first, last);
}

}  // namespace arcio::util
