#pragma once

// Environment-driven tunables

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include "arcio/diag/event_bus.h"

namespace arcio {

// 80 KiB: the usual temporary buffer size for stream copies.
inline constexpr std::size_t kTempBufferSize = 81920;
inline constexpr std::size_t kMinTransferBufferSize = 512;
inline constexpr std::size_t kMaxTransferBufferSize = 16u * 1024u * 1024u;

inline constexpr std::string_view kEnvTransferBufferSize{"ARCIO_TRANSFER_BUFFER_SIZE"};
inline constexpr std::string_view kEnvLogLevel{"ARCIO_LOG_LEVEL"};
inline constexpr std::string_view kEnvLogPath{"ARCIO_LOG_PATH"};

struct IoConfig {
  std::size_t transfer_buffer_size{kTempBufferSize};
  diag::EventSeverity log_level{diag::EventSeverity::kWarning};
  std::optional<std::filesystem::path> log_path;
};

// Reads the ARCIO_* environment variables. Unset, empty or malformed values
// keep their defaults; buffer sizes are clamped to
// [kMinTransferBufferSize, kMaxTransferBufferSize].
IoConfig LoadIoConfig();

// Parses a transfer buffer size the way LoadIoConfig does.
std::size_t ResolveTransferBufferSize(const char* raw);

// Chunk size used by the stream helpers when the caller does not pass one.
// Resolved once per process.
std::size_t DefaultTransferBufferSize();

}  // namespace arcio
