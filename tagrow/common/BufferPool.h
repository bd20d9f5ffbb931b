/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "tagrow/common/Buffer.h"

namespace tagrow {

// A pool of reusable write buffers. A buffer is leased with reserveBuffer()
// and goes back to the pool, reset, when the lease is destroyed. The pool is
// threadsafe; a leased buffer is exclusive to its holder.
//
// Leasing from an empty pool allocates a fresh buffer rather than blocking.
// On return, buffers beyond |maxPoolSize| are freed, so the pool retains at
// most |maxPoolSize| buffers.
class BufferPool {
 public:
  class Lease {
   public:
    Lease(BufferPool& pool, std::unique_ptr<WriteBuffer> buffer)
        : pool_{&pool}, buffer_{std::move(buffer)} {}

    Lease(Lease&& other) noexcept
        : pool_{other.pool_}, buffer_{std::move(other.buffer_)} {}

    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        release();
        pool_ = other.pool_;
        buffer_ = std::move(other.buffer_);
      }
      return *this;
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    ~Lease() {
      release();
    }

    WriteBuffer& operator*() const {
      return *buffer_;
    }

    WriteBuffer* operator->() const {
      return buffer_.get();
    }

   private:
    void release() {
      if (buffer_) {
        pool_->addBuffer(std::move(buffer_));
      }
    }

    BufferPool* pool_;
    std::unique_ptr<WriteBuffer> buffer_;
  };

  explicit BufferPool(
      size_t maxPoolSize = std::max(1u, std::thread::hardware_concurrency()),
      uint64_t initialBufferCapacity = kDefaultBufferCapacity);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  Lease reserveBuffer();

  // Number of idle buffers currently held by the pool.
  size_t size();

  size_t maxPoolSize() const {
    return maxPoolSize_;
  }

 private:
  static constexpr uint64_t kDefaultBufferCapacity = 1 << 20;

  void addBuffer(std::unique_ptr<WriteBuffer> buffer);

  const size_t maxPoolSize_;
  const uint64_t initialBufferCapacity_;
  std::mutex mutex_;
  std::vector<std::unique_ptr<WriteBuffer>> pool_;
};

} // namespace tagrow
