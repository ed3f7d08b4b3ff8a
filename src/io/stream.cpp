#include "arcio/io/stream.h"

#include <algorithm>
#include <cstring>
#include <ios>
#include <istream>
#include <ostream>
#include <string>

#include "arcio/errors.h"

namespace arcio::io {
namespace {

[[noreturn]] void ThrowNotSupported(std::string_view message) {
  throw Error{ErrorDomain::IO, errors::io::kNotSupported, std::string(message)};
}

[[noreturn]] void ThrowStreamFailure(std::string_view message, const std::ios& stream) {
  throw Error{ErrorDomain::IO, errors::io::kStreamFailure, std::string(message),
              static_cast<int>(stream.rdstate())};
}

}  // namespace

void Stream::Write(std::span<const uint8_t>) {
  ThrowNotSupported(errors::msg::kStreamNotWritable);
}

int64_t Stream::Position() const {
  ThrowNotSupported(errors::msg::kStreamNotSeekable);
}

void Stream::SetPosition(int64_t) {
  ThrowNotSupported(errors::msg::kStreamNotSeekable);
}

int64_t Stream::Length() const {
  ThrowNotSupported(errors::msg::kStreamNotSeekable);
}

// --- MemoryStream ---------------------------------------------------------------

MemoryStream::MemoryStream(std::vector<uint8_t> data) : data_(std::move(data)) {}

size_t MemoryStream::Read(std::span<uint8_t> buffer) {
  if (position_ >= data_.size() || buffer.empty()) {
    return 0;
  }
  const size_t count = std::min(buffer.size(), data_.size() - position_);
  std::memcpy(buffer.data(), data_.data() + position_, count);
  position_ += count;
  return count;
}

void MemoryStream::Write(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  const size_t end = position_ + data.size();
  if (end > data_.size()) {
    data_.resize(end, 0);
  }
  std::memcpy(data_.data() + position_, data.data(), data.size());
  position_ = end;
}

void MemoryStream::SetPosition(int64_t position) {
  if (position < 0) {
    ThrowInvalidArgument(errors::msg::kSeekBeforeBegin);
  }
  position_ = static_cast<size_t>(position);
}

// --- StdInputStream -------------------------------------------------------------

StdInputStream::StdInputStream(std::istream& in) : in_(in) {
  seekable_ = static_cast<std::streamoff>(in_.tellg()) >= 0;
  if (!seekable_) {
    in_.clear(in_.rdstate() & ~std::ios::failbit);
  }
}

size_t StdInputStream::Read(std::span<uint8_t> buffer) {
  if (buffer.empty()) {
    return 0;
  }
  in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
  const auto count = static_cast<size_t>(in_.gcount());
  if (in_.bad()) {
    ThrowStreamFailure(errors::msg::kStdStreamReadFailed, in_);
  }
  if (in_.eof()) {
    // A short read at end of data sets eof|fail; keep the stream usable for
    // later seeks.
    in_.clear();
  }
  return count;
}

int64_t StdInputStream::Position() const {
  if (!seekable_) {
    ThrowNotSupported(errors::msg::kStreamNotSeekable);
  }
  return static_cast<int64_t>(static_cast<std::streamoff>(in_.tellg()));
}

void StdInputStream::SetPosition(int64_t position) {
  if (!seekable_) {
    ThrowNotSupported(errors::msg::kStreamNotSeekable);
  }
  if (position < 0) {
    ThrowInvalidArgument(errors::msg::kSeekBeforeBegin);
  }
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
  if (!in_) {
    ThrowStreamFailure(errors::msg::kStdStreamReadFailed, in_);
  }
}

int64_t StdInputStream::Length() const {
  if (!seekable_) {
    ThrowNotSupported(errors::msg::kStreamNotSeekable);
  }
  const auto current = in_.tellg();
  in_.seekg(0, std::ios::end);
  const auto end = in_.tellg();
  in_.seekg(current, std::ios::beg);
  if (!in_) {
    ThrowStreamFailure(errors::msg::kStdStreamReadFailed, in_);
  }
  return static_cast<int64_t>(static_cast<std::streamoff>(end));
}

// --- StdOutputStream ------------------------------------------------------------

size_t StdOutputStream::Read(std::span<uint8_t>) {
  ThrowNotSupported(errors::msg::kStreamNotReadable);
}

void StdOutputStream::Write(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out_) {
    ThrowStreamFailure(errors::msg::kStdStreamWriteFailed, out_);
  }
}

void StdOutputStream::Flush() {
  out_.flush();
  if (!out_) {
    ThrowStreamFailure(errors::msg::kStdStreamWriteFailed, out_);
  }
}

}  // namespace arcio::io
