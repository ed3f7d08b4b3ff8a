#pragma once

#include <string_view>

namespace arcio::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kNullStream{"Stream must not be null"};
inline constexpr std::string_view kNullBuffer{"Buffer must not be null"};
inline constexpr std::string_view kOffsetOutOfRange{"Offset outside buffer bounds"};
inline constexpr std::string_view kLengthOutOfRange{"Length exceeds remaining buffer space"};
inline constexpr std::string_view kNegativeLength{"Length must not be negative"};
inline constexpr std::string_view kByteOrderWriteOutOfRange{"Byte-order write exceeds buffer bounds"};
inline constexpr std::string_view kByteOrderReadOutOfRange{"Byte-order read exceeds buffer bounds"};
inline constexpr std::string_view kUnexpectedEndOfStream{"Unexpected end of stream"};
inline constexpr std::string_view kStreamNotReadable{"Stream does not support reading"};
inline constexpr std::string_view kStreamNotWritable{"Stream does not support writing"};
inline constexpr std::string_view kStreamNotSeekable{"Stream does not support seeking"};
inline constexpr std::string_view kSkipPastMaxPosition{"Skip amount moves the position past the largest representable offset"};
inline constexpr std::string_view kSeekBeforeBegin{"Attempted to seek before the beginning of the stream"};
inline constexpr std::string_view kStdStreamReadFailed{"Underlying std::istream reported a read failure"};
inline constexpr std::string_view kStdStreamWriteFailed{"Underlying std::ostream reported a write failure"};
inline constexpr std::string_view kOperationCancelled{"Operation cancelled"};
inline constexpr std::string_view kDosYearOutOfRange{"Year not representable in a DOS timestamp (1980-2107)"};
inline constexpr std::string_view kUnixTimeOverflow{"Unix time outside the representable calendar range"};
inline constexpr std::string_view kInvalidCalendarValue{"Date and time fields do not form a valid calendar value"};
inline constexpr std::string_view kInvalidBufferSize{"Transfer buffer size must be positive"};
}  // namespace arcio::errors::msg
