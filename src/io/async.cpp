#include "arcio/io/async.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "arcio/core/byte_order.h"
#include "arcio/diag/event_bus.h"
#include "arcio/errors.h"
#include "arcio/io/stream_util.h"
#include "arcio/io/sub_stream.h"

namespace arcio::io {
namespace {

void PublishCancelled(const char* operation, int64_t progress) {
  diag::Event event;
  event.category = diag::EventCategory::kDiagnostics;
  event.severity = diag::EventSeverity::kWarning;
  event.event_id = "stream_operation_cancelled";
  event.message = std::string(errors::msg::kOperationCancelled);
  event.fields.emplace_back("operation", operation);
  event.fields.emplace_back("bytes_processed", std::to_string(progress), diag::FieldPrivacy::kPublic, true);
  diag::EventBus::Instance().Publish(event);
}

// Drives an operation one I/O step per executor task. Derived classes do the
// I/O in Step() and hand the result to their promise in Complete().
class AsyncStepper : public std::enable_shared_from_this<AsyncStepper> {
public:
  virtual ~AsyncStepper() = default;

  void Start() { Schedule(); }

protected:
  AsyncStepper(Executor& executor, std::stop_token token, const char* name)
      : executor_(executor), token_(std::move(token)), name_(name) {}

  // Performs one read (and write, where applicable). Returns true when the
  // operation has finished.
  virtual bool Step() = 0;
  virtual void Complete() = 0;
  virtual void Fail(std::exception_ptr error) = 0;
  // Drops borrowed views before the result becomes visible to the caller.
  virtual void Release() noexcept {}
  [[nodiscard]] virtual int64_t Progress() const noexcept = 0;

private:
  void Schedule() {
    auto self = shared_from_this();
    executor_.Post([self]() { self->RunStep(); });
  }

  void RunStep() {
    if (token_.stop_requested()) {
      const int64_t progress = Progress();
      Release();
      PublishCancelled(name_, progress);
      Fail(std::make_exception_ptr(Error{ErrorDomain::State, errors::state::kCancelled,
                                         std::string(errors::msg::kOperationCancelled) + ": " + name_}));
      return;
    }

    bool finished = false;
    try {
      finished = Step();
    } catch (...) {
      Release();
      Fail(std::current_exception());
      return;
    }
    if (finished) {
      Release();
      Complete();
      return;
    }

    try {
      Schedule();
    } catch (...) {
      Release();
      Fail(std::current_exception());
    }
  }

  Executor& executor_;
  std::stop_token token_;
  const char* name_;
};

template <class T>
class PromiseStepper : public AsyncStepper {
public:
  std::future<T> Future() { return promise_.get_future(); }

protected:
  using AsyncStepper::AsyncStepper;

  void Fail(std::exception_ptr error) override { promise_.set_exception(std::move(error)); }

  std::promise<T> promise_;
};

class TransferOperation final : public PromiseStepper<int64_t> {
public:
  TransferOperation(Stream& source, Stream& destination, int64_t max_length, size_t buffer_size,
                    Executor& executor, std::stop_token token)
      : PromiseStepper<int64_t>(executor, std::move(token), "transfer"),
        view_(std::make_unique<ReadOnlySubStream>(source, max_length)),
        destination_(destination),
        buffer_(buffer_size) {}

protected:
  bool Step() override {
    const size_t read = view_->Read(std::span<uint8_t>(buffer_.data(), buffer_.size()));
    if (read == 0) {
      transferred_ = view_->Position();
      return true;
    }
    destination_.Write(std::span<const uint8_t>(buffer_.data(), read));
    transferred_ = view_->Position();
    return false;
  }

  void Complete() override { promise_.set_value(transferred_); }
  void Release() noexcept override { view_.reset(); }
  int64_t Progress() const noexcept override { return transferred_; }

private:
  std::unique_ptr<ReadOnlySubStream> view_;
  Stream& destination_;
  std::vector<uint8_t> buffer_;
  int64_t transferred_{0};
};

class SkipOperation final : public PromiseStepper<void> {
public:
  SkipOperation(Stream& source, int64_t amount, size_t buffer_size, Executor& executor, std::stop_token token)
      : PromiseStepper<void>(executor, std::move(token), "skip"),
        source_(source),
        remaining_(amount),
        buffer_(source.CanSeek() ? 0
                                 : static_cast<size_t>(std::clamp<int64_t>(
                                       amount, 0, static_cast<int64_t>(buffer_size)))) {}

protected:
  bool Step() override {
    if (source_.CanSeek()) {
      Skip(source_, remaining_);
      skipped_ = remaining_;
      return true;
    }
    if (remaining_ <= 0) {
      return true;
    }
    const auto to_read = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(buffer_.size()), remaining_));
    const size_t read = source_.Read(std::span<uint8_t>(buffer_.data(), to_read));
    if (read == 0) {
      return true;
    }
    remaining_ -= static_cast<int64_t>(read);
    skipped_ += static_cast<int64_t>(read);
    return remaining_ <= 0;
  }

  void Complete() override { promise_.set_value(); }
  int64_t Progress() const noexcept override { return skipped_; }

private:
  Stream& source_;
  int64_t remaining_{0};
  int64_t skipped_{0};
  std::vector<uint8_t> buffer_;
};

class ReadFullyOperation final : public PromiseStepper<bool> {
public:
  ReadFullyOperation(Stream& source, std::span<uint8_t> buffer, size_t offset, size_t count,
                     Executor& executor, std::stop_token token)
      : PromiseStepper<bool>(executor, std::move(token), "read_fully"),
        source_(source),
        target_(buffer.subspan(offset, count)) {}

protected:
  bool Step() override {
    if (total_ >= target_.size()) {
      return true;
    }
    const size_t read = source_.Read(target_.subspan(total_));
    if (read == 0) {
      return true;
    }
    total_ += read;
    return total_ >= target_.size();
  }

  void Complete() override { promise_.set_value(total_ >= target_.size()); }
  int64_t Progress() const noexcept override { return static_cast<int64_t>(total_); }

private:
  Stream& source_;
  std::span<uint8_t> target_;
  size_t total_{0};
};

template <class Operation, class... Args>
auto Launch(Args&&... args) {
  auto operation = std::make_shared<Operation>(std::forward<Args>(args)...);
  auto future = operation->Future();
  operation->Start();
  return future;
}

void RequirePositiveBufferSize(size_t buffer_size) {
  if (buffer_size == 0) {
    ThrowInvalidArgument(errors::msg::kInvalidBufferSize);
  }
}

}  // namespace

std::future<int64_t> TransferToAsync(Stream& source, Stream& destination, int64_t max_length,
                                     Executor& executor, std::stop_token token, size_t buffer_size) {
  RequirePositiveBufferSize(buffer_size);
  return Launch<TransferOperation>(source, destination, max_length, buffer_size, executor, std::move(token));
}

std::future<void> SkipAsync(Stream& source, int64_t amount, Executor& executor, std::stop_token token,
                            size_t buffer_size) {
  RequirePositiveBufferSize(buffer_size);
  return Launch<SkipOperation>(source, amount, buffer_size, executor, std::move(token));
}

std::future<bool> ReadFullyAsync(Stream& source, std::span<uint8_t> buffer, Executor& executor,
                                 std::stop_token token) {
  return ReadFullyAsync(source, buffer, 0, buffer.size(), executor, std::move(token));
}

std::future<bool> ReadFullyAsync(Stream& source, std::span<uint8_t> buffer, size_t offset, size_t count,
                                 Executor& executor, std::stop_token token) {
  if (!core::RangeFits(buffer.size(), offset, count)) {
    ThrowOutOfRange(std::string(errors::msg::kLengthOutOfRange) + " (offset " + std::to_string(offset) +
                    ", count " + std::to_string(count) + ", size " + std::to_string(buffer.size()) + ")");
  }
  return Launch<ReadFullyOperation>(source, buffer, offset, count, executor, std::move(token));
}

}  // namespace arcio::io
