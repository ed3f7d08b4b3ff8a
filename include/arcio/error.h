#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace arcio {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Validation = 0x04,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves 0x100 codes so library codes never collide with
  // platform values carried in Error::native_code. Codes are stable across
  // releases.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  namespace errors {
    // Helper to construct reserved error codes.
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kUnexpectedEndOfStream = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kNotSupported = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kStreamFailure = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace validation {
      inline constexpr int kInvalidArgument = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kOutOfRange = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kTimestampOverflow = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace state {
      inline constexpr int kCancelled = Make(ErrorDomain::State, 0x01);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;  // iostate bits of a failed std stream
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt)
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native) {}
  };

  // InvalidArgument covers both malformed arguments and the OutOfRange
  // sub-kind raised by bounds checks.
  inline bool IsInvalidArgument(const Error& error) noexcept {
    return error.domain == ErrorDomain::Validation &&
           (error.code == errors::validation::kInvalidArgument ||
            error.code == errors::validation::kOutOfRange);
  }

  inline bool IsEndOfStream(const Error& error) noexcept {
    return error.domain == ErrorDomain::IO && error.code == errors::io::kUnexpectedEndOfStream;
  }

  inline bool IsCancelled(const Error& error) noexcept {
    return error.domain == ErrorDomain::State && error.code == errors::state::kCancelled;
  }

  [[noreturn]] inline void ThrowInvalidArgument(std::string_view message) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidArgument, std::string(message)};
  }

  [[noreturn]] inline void ThrowOutOfRange(std::string_view message) {
    throw Error{ErrorDomain::Validation, errors::validation::kOutOfRange, std::string(message)};
  }
} // namespace arcio
