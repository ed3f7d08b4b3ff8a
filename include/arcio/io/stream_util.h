#pragma once

// Blocking transfer primitives

#include <cstddef>
#include <cstdint>
#include <span>

#include "arcio/config.h"
#include "arcio/error.h"
#include "arcio/io/stream.h"

namespace arcio::io {

// Copies |source| to |destination| until |source| reports end of data, using
// chunks of |buffer_size| bytes. Returns the number of bytes copied.
int64_t CopyStream(Stream& source, Stream& destination, size_t buffer_size = DefaultTransferBufferSize());

// Copies at most |max_length| bytes from the current position of |source| to
// |destination| through a bounded view. Returns the bytes actually moved,
// which is smaller than |max_length| when |source| ends first.
int64_t TransferTo(Stream& source, Stream& destination, int64_t max_length,
                   size_t buffer_size = DefaultTransferBufferSize());

// Advances |source| by |amount| bytes. Seekable streams are repositioned
// without reading; others are drained in chunks until |amount| bytes were
// consumed or the stream ends. Early end of data is not an error.
void Skip(Stream& source, int64_t amount, size_t buffer_size = DefaultTransferBufferSize());

// Lenient full read: fills |buffer| (or buffer[offset, offset + count)) unless
// the stream ends first. Returns true only when the range was filled. Short
// reads never throw; an invalid sub-range throws Error (Validation).
[[nodiscard]] bool ReadFully(Stream& source, std::span<uint8_t> buffer);
[[nodiscard]] bool ReadFully(Stream& source, std::span<uint8_t> buffer, size_t offset, size_t count);

// Strict full read of buffer[offset, offset + length). Argument problems
// (null stream, null buffer, offset/length outside the buffer) throw
// Error{Validation, kInvalidArgument} before any I/O; a short read throws
// Error{IO, kUnexpectedEndOfStream}.
void ReadExact(Stream* stream, std::span<uint8_t> buffer, int64_t offset, int64_t length);

}  // namespace arcio::io
