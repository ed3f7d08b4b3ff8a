#pragma once

// Suspendable forms of the stream helpers

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <span>
#include <stop_token>

#include "arcio/config.h"
#include "arcio/io/stream.h"

namespace arcio::io {

// Scheduler supplied by the caller. Every I/O step of an async operation is
// posted as its own task; the executor must keep running tasks until the
// returned future is ready and must outlive the operation. Post() queues the
// task; running it inline would turn every chunk into a nested call.
class Executor {
public:
  virtual ~Executor() = default;
  virtual void Post(std::function<void()> task) = 0;
};

// The operations below share these rules:
//  - streams and buffers are borrowed and must outlive the returned future;
//  - |token| is checked before every step. Once a stop is requested no further
//    I/O is issued and the future throws Error{State, kCancelled}. Bytes
//    already written to a destination stay there;
//  - errors raised by the streams are delivered through the future.

std::future<int64_t> TransferToAsync(Stream& source, Stream& destination, int64_t max_length,
                                     Executor& executor, std::stop_token token = {},
                                     size_t buffer_size = DefaultTransferBufferSize());

std::future<void> SkipAsync(Stream& source, int64_t amount, Executor& executor,
                            std::stop_token token = {},
                            size_t buffer_size = DefaultTransferBufferSize());

std::future<bool> ReadFullyAsync(Stream& source, std::span<uint8_t> buffer, Executor& executor,
                                 std::stop_token token = {});

std::future<bool> ReadFullyAsync(Stream& source, std::span<uint8_t> buffer, size_t offset, size_t count,
                                 Executor& executor, std::stop_token token = {});

}  // namespace arcio::io
