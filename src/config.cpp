#include "arcio/config.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

namespace arcio {
namespace {

const char* GetEnv(std::string_view name) {
  const std::string key(name);
  return std::getenv(key.c_str());
}

}  // namespace

std::size_t ResolveTransferBufferSize(const char* raw) {
  if (!raw || *raw == '\0') {
    return kTempBufferSize;
  }
  unsigned long long value = 0;
  const char* end = raw + std::strlen(raw);
  auto [ptr, ec] = std::from_chars(raw, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    return kTempBufferSize;
  }
  value = std::clamp<unsigned long long>(value, kMinTransferBufferSize, kMaxTransferBufferSize);
  return static_cast<std::size_t>(value);
}

IoConfig LoadIoConfig() {
  IoConfig config;
  config.transfer_buffer_size = ResolveTransferBufferSize(GetEnv(kEnvTransferBufferSize));

  if (const char* level = GetEnv(kEnvLogLevel); level && *level) {
    if (auto parsed = diag::ParseSeverity(level)) {
      config.log_level = *parsed;
    }
  }
  if (const char* path = GetEnv(kEnvLogPath); path && *path) {
    config.log_path = std::filesystem::path(path);
  }
  return config;
}

std::size_t DefaultTransferBufferSize() {
  static const std::size_t size = LoadIoConfig().transfer_buffer_size;
  return size;
}

}  // namespace arcio
