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
#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>

#include "tagrow/common/EncodingPrimitives.h"

// Contiguous, growable byte buffer used to assemble RowBinary output.
//
// Standard usage:
//   buffer.reset();
//   buffer.writeUint16(days);
//   buffer.writeString(name);
//   sink.append(buffer.bytes());
//
// Memory is kept across reset() calls, so a buffer that is reused for many
// records only allocates until it has grown to the largest record.

namespace tagrow {

// Buffer is NOT threadsafe: external locking is required.
class WriteBuffer {
 public:
  explicit WriteBuffer(uint64_t initialCapacity = kMinCapacity) {
    reserve(initialCapacity);
  }

  WriteBuffer(const WriteBuffer&) = delete;
  WriteBuffer& operator=(const WriteBuffer&) = delete;

  uint64_t size() const {
    return size_;
  }

  bool empty() const {
    return size_ == 0;
  }

  uint64_t capacity() const {
    return capacity_;
  }

  const char* data() const noexcept {
    return data_.get();
  }

  std::string_view bytes() const {
    return {data_.get(), size_};
  }

  // Drops the content, keeps the memory.
  void reset() {
    size_ = 0;
  }

  // Ensures that *this can hold |size| bytes without reallocating. Never
  // shrinks.
  void reserve(uint64_t size) {
    if (size > capacity_) {
      auto newData = std::make_unique<char[]>(size);
      if (size_ > 0) {
        std::memcpy(newData.get(), data_.get(), size_);
      }
      data_ = std::move(newData);
      capacity_ = size;
    }
  }

  // Grows the content by |bytes| and returns the position to write them to.
  // The returned pointer is only valid until the next call growing *this.
  char* extend(uint64_t bytes) {
    if (size_ + bytes > capacity_) {
      reserve(std::max(size_ + bytes, capacity_ * 2));
    }
    char* pos = data_.get() + size_;
    size_ += bytes;
    return pos;
  }

  void writeUint16(uint16_t value) {
    char* pos = extend(sizeof(uint16_t));
    encoding::writeUint16(value, pos);
  }

  void writeUint32(uint32_t value) {
    char* pos = extend(sizeof(uint32_t));
    encoding::writeUint32(value, pos);
  }

  void writeFloat64(double value) {
    char* pos = extend(sizeof(double));
    encoding::writeFloat64(value, pos);
  }

  void writeUVarint(uint64_t value) {
    char* pos = extend(varint::varintSize(value));
    varint::writeVarint(value, &pos);
  }

  // Length prefixed (RowBinary String).
  void writeString(std::string_view value) {
    char* pos = extend(encoding::stringSize(value));
    encoding::writeString(value, pos);
  }

  // Raw bytes, no length prefix.
  void write(std::string_view value) {
    if (!value.empty()) {
      std::memcpy(extend(value.size()), value.data(), value.size());
    }
  }

 private:
  static constexpr uint64_t kMinCapacity = 1 << 10;

  std::unique_ptr<char[]> data_;
  uint64_t capacity_{0};
  uint64_t size_{0};
};

} // namespace tagrow
