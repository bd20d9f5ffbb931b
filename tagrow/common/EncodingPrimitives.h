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

#include <folly/lang/Bits.h>

#include <cstdint>
#include <cstring>
#include <string_view>
#include <type_traits>

#include "tagrow/common/Varint.h"

// Primitive little endian writes and reads in ClickHouse RowBinary layout.
// Fixed width values are stored little endian, strings are stored as a varint
// length followed by the raw bytes. None of these check bounds: callers
// reserve space up front (writes) or validate sizes (reads).

namespace tagrow::encoding {

template <typename T>
inline void write(T value, char*& pos) {
  static_assert(std::is_arithmetic_v<T>);
  if constexpr (std::is_integral_v<T>) {
    value = folly::Endian::little(value);
  }
  std::memcpy(pos, &value, sizeof(T));
  pos += sizeof(T);
}

template <typename T>
inline T read(const char*& pos) {
  static_assert(std::is_arithmetic_v<T>);
  T value;
  std::memcpy(&value, pos, sizeof(T));
  pos += sizeof(T);
  if constexpr (std::is_integral_v<T>) {
    value = folly::Endian::little(value);
  }
  return value;
}

inline void writeUint16(uint16_t value, char*& pos) {
  write<uint16_t>(value, pos);
}

inline void writeUint32(uint32_t value, char*& pos) {
  write<uint32_t>(value, pos);
}

inline void writeFloat64(double value, char*& pos) {
  write<double>(value, pos);
}

inline uint16_t readUint16(const char*& pos) {
  return read<uint16_t>(pos);
}

inline uint32_t readUint32(const char*& pos) {
  return read<uint32_t>(pos);
}

inline double readFloat64(const char*& pos) {
  return read<double>(pos);
}

// Bytes needed by writeString(|value|).
inline uint64_t stringSize(std::string_view value) {
  return varint::varintSize(value.size()) + value.size();
}

inline void writeString(std::string_view value, char*& pos) {
  varint::writeVarint(static_cast<uint64_t>(value.size()), &pos);
  if (!value.empty()) {
    std::memcpy(pos, value.data(), value.size());
    pos += value.size();
  }
}

inline std::string_view readString(const char*& pos) {
  const auto size = varint::readVarint64(&pos);
  std::string_view value{pos, size};
  pos += size;
  return value;
}

} // namespace tagrow::encoding
