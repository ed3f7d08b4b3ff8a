#include "arcio/io/sub_stream.h"

#include <algorithm>
#include <string>

#include "arcio/errors.h"

namespace arcio::io {

ReadOnlySubStream::ReadOnlySubStream(Stream& base, int64_t bytes_to_read)
    : ReadOnlySubStream(base, std::nullopt, bytes_to_read) {}

ReadOnlySubStream::ReadOnlySubStream(Stream& base, std::optional<int64_t> origin, int64_t bytes_to_read)
    : base_(base), bytes_left_(bytes_to_read) {
  if (bytes_to_read < 0) {
    ThrowInvalidArgument(std::string(errors::msg::kNegativeLength) + ": " + std::to_string(bytes_to_read));
  }
  if (origin) {
    base_.SetPosition(*origin);
  }
}

size_t ReadOnlySubStream::Read(std::span<uint8_t> buffer) {
  if (bytes_left_ <= 0 || buffer.empty()) {
    return 0;
  }
  const auto window = static_cast<size_t>(std::min<int64_t>(bytes_left_, static_cast<int64_t>(buffer.size())));
  const size_t read = base_.Read(buffer.first(window));
  bytes_left_ -= static_cast<int64_t>(read);
  position_ += static_cast<int64_t>(read);
  return read;
}

}  // namespace arcio::io
