#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "arcio/io/stream.h"

namespace arcio::io {

// Read-only window over |base| exposing at most |bytes_to_read| bytes from
// the base stream's current position (or from |origin| when given, which
// requires a seekable base). Position() reports the bytes consumed through
// the view. The view never closes or owns the base stream.
class ReadOnlySubStream final : public Stream {
public:
  ReadOnlySubStream(Stream& base, int64_t bytes_to_read);
  ReadOnlySubStream(Stream& base, std::optional<int64_t> origin, int64_t bytes_to_read);

  ReadOnlySubStream(const ReadOnlySubStream&) = delete;
  ReadOnlySubStream& operator=(const ReadOnlySubStream&) = delete;

  bool CanRead() const override { return true; }

  size_t Read(std::span<uint8_t> buffer) override;

  int64_t Position() const override { return position_; }

  [[nodiscard]] int64_t BytesLeftToRead() const noexcept { return bytes_left_; }

private:
  Stream& base_;
  int64_t bytes_left_{0};
  int64_t position_{0};
};

}  // namespace arcio::io
