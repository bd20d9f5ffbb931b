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
#include "tagrow/common/BufferPool.h"

#include "tagrow/common/Exceptions.h"

namespace tagrow {

BufferPool::BufferPool(size_t maxPoolSize, uint64_t initialBufferCapacity)
    : maxPoolSize_{maxPoolSize},
      initialBufferCapacity_{initialBufferCapacity} {
  TAGROW_USER_CHECK(maxPoolSize_ > 0, "max pool size must be > 0");
  pool_.reserve(maxPoolSize_);
  for (size_t i = 0; i < maxPoolSize_; ++i) {
    pool_.push_back(std::make_unique<WriteBuffer>(initialBufferCapacity_));
  }
}

BufferPool::Lease BufferPool::reserveBuffer() {
  std::unique_ptr<WriteBuffer> buffer;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    if (!pool_.empty()) {
      buffer = std::move(pool_.back());
      pool_.pop_back();
    }
  }
  if (!buffer) {
    buffer = std::make_unique<WriteBuffer>(initialBufferCapacity_);
  }
  return Lease{*this, std::move(buffer)};
}

size_t BufferPool::size() {
  std::lock_guard<std::mutex> lock{mutex_};
  return pool_.size();
}

void BufferPool::addBuffer(std::unique_ptr<WriteBuffer> buffer) {
  buffer->reset();
  std::lock_guard<std::mutex> lock{mutex_};
  if (pool_.size() < maxPoolSize_) {
    pool_.push_back(std::move(buffer));
  }
}

} // namespace tagrow
