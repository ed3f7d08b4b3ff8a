#include "arcio/core/file_name.h"

#include <unordered_set>

#include "arcio/diag/event_bus.h"

namespace arcio::core {
namespace {

constexpr char kReplacementChar = '_';

const std::unordered_set<char>& PosixInvalidChars() {
  static const std::unordered_set<char> chars{'\0', '/'};
  return chars;
}

const std::unordered_set<char>& WindowsInvalidChars() {
  static const std::unordered_set<char> chars = [] {
    std::unordered_set<char> set{'"', '<', '>', '|', ':', '*', '?', '\\', '/'};
    for (int c = 0; c < 0x20; ++c) {
      set.insert(static_cast<char>(c));
    }
    return set;
  }();
  return chars;
}

const std::unordered_set<char>& InvalidCharsFor(FileNameFlavor flavor) {
  switch (flavor) {
  case FileNameFlavor::kPosix:
    return PosixInvalidChars();
  case FileNameFlavor::kWindows:
    return WindowsInvalidChars();
  case FileNameFlavor::kNative:
    break;
  }
#if defined(_WIN32)
  return WindowsInvalidChars();
#else
  return PosixInvalidChars();
#endif
}

}  // namespace

bool IsInvalidFileNameChar(char ch, FileNameFlavor flavor) {
  return InvalidCharsFor(flavor).count(ch) != 0;
}

std::string ReplaceInvalidFileNameChars(std::string_view file_name, FileNameFlavor flavor) {
  const auto& invalid = InvalidCharsFor(flavor);
  std::string out;
  out.reserve(file_name.size());
  size_t replaced = 0;
  for (char ch : file_name) {
    if (invalid.count(ch) != 0) {
      out.push_back(kReplacementChar);
      ++replaced;
    } else {
      out.push_back(ch);
    }
  }

  if (replaced != 0) {
    diag::Event event;
    event.category = diag::EventCategory::kDiagnostics;
    event.severity = diag::EventSeverity::kDebug;
    event.event_id = "file_name_sanitized";
    event.message = "Replaced invalid file name characters";
    event.fields.emplace_back("file_name", std::string(file_name), diag::FieldPrivacy::kHash);
    event.fields.emplace_back("replaced", std::to_string(replaced), diag::FieldPrivacy::kPublic, true);
    diag::EventBus::Instance().Publish(event);
  }
  return out;
}

}  // namespace arcio::core
