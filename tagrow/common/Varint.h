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

#include <cstdint>

// Varint-related encoding methods. Same binary encoding as folly/Varint.h and
// as the unsigned LEB128 length prefixes of ClickHouse RowBinary. The
// unchecked methods do not check bounds; tryReadVarint64 does and is the one
// to use on untrusted input.

namespace tagrow::varint {

// Max bytes a 64 bit varint can occupy.
constexpr uint32_t kMaxVarintLength64 = 10;

template <typename T>
inline void writeVarint(T val, char** pos) noexcept {
  while (val >= 128) {
    *((*pos)++) = 0x80 | (val & 0x7f);
    val >>= 7;
  }
  *((*pos)++) = val;
}

// Returns the number of bytes |val| occupies once varint encoded.
inline uint32_t varintSize(uint64_t val) noexcept {
  uint32_t size = 1;
  while (val >= 128) {
    val >>= 7;
    ++size;
  }
  return size;
}

inline uint64_t readVarint64(const char** pos) noexcept {
  uint64_t value = 0;
  uint32_t shift = 0;
  while (true) {
    const uint8_t byte = static_cast<uint8_t>(*((*pos)++));
    value |= static_cast<uint64_t>(byte & 127) << shift;
    if (!(byte & 128)) {
      return value;
    }
    shift += 7;
  }
}

enum class VarintStatus {
  Ok,
  // Input ended in the middle of the varint.
  Truncated,
  // More than kMaxVarintLength64 bytes, or bits past the 64th set.
  Overflow,
};

// Bounds checked decode of a single varint in [*pos, end). On success |*pos|
// is moved past the varint. On failure |*pos| is left untouched.
inline VarintStatus
tryReadVarint64(const char** pos, const char* end, uint64_t& value) noexcept {
  const char* p = *pos;
  uint64_t result = 0;
  for (uint32_t i = 0; i < kMaxVarintLength64; ++i) {
    if (p == end) {
      return VarintStatus::Truncated;
    }
    const uint8_t byte = static_cast<uint8_t>(*p++);
    if (i == kMaxVarintLength64 - 1 && byte > 1) {
      return VarintStatus::Overflow;
    }
    result |= static_cast<uint64_t>(byte & 127) << (7 * i);
    if (!(byte & 128)) {
      value = result;
      *pos = p;
      return VarintStatus::Ok;
    }
  }
  return VarintStatus::Overflow;
}

} // namespace tagrow::varint
