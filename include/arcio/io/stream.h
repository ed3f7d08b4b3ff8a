#pragma once

// Stream abstraction

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

#include "arcio/error.h"

namespace arcio::io {

// Byte stream seen by the transfer helpers. Read() returns the number of bytes
// placed in |buffer|; 0 signals end of data for a non-empty buffer. Failures
// are reported as arcio::Error. Operations a stream does not support throw
// Error{IO, kNotSupported}.
class Stream {
public:
  virtual ~Stream() = default;

  [[nodiscard]] virtual bool CanRead() const = 0;
  [[nodiscard]] virtual bool CanWrite() const { return false; }
  [[nodiscard]] virtual bool CanSeek() const { return false; }

  virtual size_t Read(std::span<uint8_t> buffer) = 0;
  virtual void Write(std::span<const uint8_t> data);

  [[nodiscard]] virtual int64_t Position() const;
  virtual void SetPosition(int64_t position);
  [[nodiscard]] virtual int64_t Length() const;

  virtual void Flush() {}
};

// Growable in-memory stream, readable, writable and seekable.
class MemoryStream final : public Stream {
public:
  MemoryStream() = default;
  explicit MemoryStream(std::vector<uint8_t> data);

  bool CanRead() const override { return true; }
  bool CanWrite() const override { return true; }
  bool CanSeek() const override { return true; }

  size_t Read(std::span<uint8_t> buffer) override;
  void Write(std::span<const uint8_t> data) override;

  int64_t Position() const override { return static_cast<int64_t>(position_); }
  void SetPosition(int64_t position) override;
  int64_t Length() const override { return static_cast<int64_t>(data_.size()); }

  [[nodiscard]] const std::vector<uint8_t>& Data() const noexcept { return data_; }

private:
  std::vector<uint8_t> data_;
  size_t position_{0};
};

// Adapts a std::istream. Seeking is offered when the stream reports a
// position at construction time.
class StdInputStream final : public Stream {
public:
  explicit StdInputStream(std::istream& in);

  bool CanRead() const override { return true; }
  bool CanSeek() const override { return seekable_; }

  size_t Read(std::span<uint8_t> buffer) override;

  int64_t Position() const override;
  void SetPosition(int64_t position) override;
  int64_t Length() const override;

private:
  std::istream& in_;
  bool seekable_{false};
};

// Adapts a std::ostream; write-only and not seekable.
class StdOutputStream final : public Stream {
public:
  explicit StdOutputStream(std::ostream& out) : out_(out) {}

  bool CanRead() const override { return false; }
  bool CanWrite() const override { return true; }

  size_t Read(std::span<uint8_t> buffer) override;
  void Write(std::span<const uint8_t> data) override;
  void Flush() override;

private:
  std::ostream& out_;
};

}  // namespace arcio::io
