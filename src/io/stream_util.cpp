#include "arcio/io/stream_util.h"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include "arcio/core/byte_order.h"
#include "arcio/diag/event_bus.h"
#include "arcio/errors.h"
#include "arcio/io/sub_stream.h"

namespace arcio::io {
namespace {

void RequirePositiveBufferSize(size_t buffer_size) {
  if (buffer_size == 0) {
    ThrowInvalidArgument(errors::msg::kInvalidBufferSize);
  }
}

void PublishTransfer(int64_t requested, int64_t transferred) {
  diag::Event event;
  event.category = diag::EventCategory::kTelemetry;
  event.severity = diag::EventSeverity::kDebug;
  event.event_id = "bounded_transfer_complete";
  event.fields.emplace_back("requested_bytes", std::to_string(requested), diag::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("transferred_bytes", std::to_string(transferred), diag::FieldPrivacy::kPublic, true);
  diag::EventBus::Instance().Publish(event);
}

void PublishTruncatedRead(int64_t requested, int64_t received) {
  diag::Event event;
  event.category = diag::EventCategory::kDiagnostics;
  event.severity = diag::EventSeverity::kWarning;
  event.event_id = "read_exact_truncated";
  event.message = std::string(errors::msg::kUnexpectedEndOfStream);
  event.fields.emplace_back("requested_bytes", std::to_string(requested), diag::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("received_bytes", std::to_string(received), diag::FieldPrivacy::kPublic, true);
  diag::EventBus::Instance().Publish(event);
}

}  // namespace

int64_t CopyStream(Stream& source, Stream& destination, size_t buffer_size) {
  RequirePositiveBufferSize(buffer_size);
  std::vector<uint8_t> buffer(buffer_size);
  int64_t total = 0;
  for (;;) {
    const size_t read = source.Read(std::span<uint8_t>(buffer.data(), buffer.size()));
    if (read == 0) {
      break;
    }
    destination.Write(std::span<const uint8_t>(buffer.data(), read));
    total += static_cast<int64_t>(read);
  }
  return total;
}

int64_t TransferTo(Stream& source, Stream& destination, int64_t max_length, size_t buffer_size) {
  int64_t transferred = 0;
  {
    ReadOnlySubStream limited(source, max_length);
    CopyStream(limited, destination, buffer_size);
    transferred = limited.Position();
  }
  PublishTransfer(max_length, transferred);
  return transferred;
}

void Skip(Stream& source, int64_t amount, size_t buffer_size) {
  if (source.CanSeek()) {
    const int64_t position = source.Position();
    if (amount > 0 && amount > std::numeric_limits<int64_t>::max() - position) {
      ThrowOutOfRange(std::string(errors::msg::kSkipPastMaxPosition) + " (position " + std::to_string(position) +
                      ", amount " + std::to_string(amount) + ")");
    }
    source.SetPosition(position + amount);
    return;
  }
  RequirePositiveBufferSize(buffer_size);
  std::vector<uint8_t> buffer(static_cast<size_t>(
      std::clamp<int64_t>(amount, 0, static_cast<int64_t>(buffer_size))));
  while (amount > 0) {
    const auto to_read = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(buffer.size()), amount));
    const size_t read = source.Read(std::span<uint8_t>(buffer.data(), to_read));
    if (read == 0) {
      break;
    }
    amount -= static_cast<int64_t>(read);
  }
}

bool ReadFully(Stream& source, std::span<uint8_t> buffer) {
  return ReadFully(source, buffer, 0, buffer.size());
}

bool ReadFully(Stream& source, std::span<uint8_t> buffer, size_t offset, size_t count) {
  if (!core::RangeFits(buffer.size(), offset, count)) {
    ThrowOutOfRange(std::string(errors::msg::kLengthOutOfRange) + " (offset " + std::to_string(offset) +
                    ", count " + std::to_string(count) + ", size " + std::to_string(buffer.size()) + ")");
  }
  size_t total = 0;
  while (total < count) {
    const size_t read = source.Read(buffer.subspan(offset + total, count - total));
    if (read == 0) {
      return false;
    }
    total += read;
  }
  return true;
}

void ReadExact(Stream* stream, std::span<uint8_t> buffer, int64_t offset, int64_t length) {
  if (stream == nullptr) {
    ThrowInvalidArgument(errors::msg::kNullStream);
  }
  if (buffer.data() == nullptr) {
    ThrowInvalidArgument(errors::msg::kNullBuffer);
  }
  const auto size = static_cast<int64_t>(buffer.size());
  if (offset < 0 || offset > size) {
    ThrowInvalidArgument(std::string(errors::msg::kOffsetOutOfRange) + ": " + std::to_string(offset));
  }
  if (length < 0 || length > size - offset) {
    ThrowInvalidArgument(std::string(errors::msg::kLengthOutOfRange) + ": " + std::to_string(length));
  }

  const int64_t requested = length;
  while (length > 0) {
    const size_t fetched = stream->Read(buffer.subspan(static_cast<size_t>(offset), static_cast<size_t>(length)));
    if (fetched == 0) {
      PublishTruncatedRead(requested, requested - length);
      throw Error{ErrorDomain::IO, errors::io::kUnexpectedEndOfStream,
                  std::string(errors::msg::kUnexpectedEndOfStream) + " (" + std::to_string(requested - length) +
                      " of " + std::to_string(requested) + " bytes)"};
    }
    offset += static_cast<int64_t>(fetched);
    length -= static_cast<int64_t>(fetched);
  }
}

}  // namespace arcio::io
