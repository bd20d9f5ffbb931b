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
#include <string_view>

#include "tagrow/common/Buffer.h"

namespace tagrow::rowbinary {

// Appends one points record in the layout RowBinaryReader consumes.
inline void writeRecord(
    WriteBuffer& buffer,
    std::string_view path,
    double value,
    uint32_t timestamp) {
  buffer.writeString(path);
  buffer.writeFloat64(value);
  buffer.writeUint32(timestamp);
}

} // namespace tagrow::rowbinary
