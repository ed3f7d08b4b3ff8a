#pragma once

// Archive entry names to filesystem names

#include <cstdint>
#include <string>
#include <string_view>

namespace arcio::core {

enum class FileNameFlavor : uint8_t {
  kNative = 0,  // resolves to kWindows or kPosix for the build platform
  kPosix,
  kWindows,
};

[[nodiscard]] bool IsInvalidFileNameChar(char ch, FileNameFlavor flavor = FileNameFlavor::kNative);

// Replaces every character that may not appear in a file name on the target
// filesystem with '_'. Length and all other bytes are preserved; the
// replacement is idempotent.
[[nodiscard]] std::string ReplaceInvalidFileNameChars(std::string_view file_name,
                                                      FileNameFlavor flavor = FileNameFlavor::kNative);

}  // namespace arcio::core
