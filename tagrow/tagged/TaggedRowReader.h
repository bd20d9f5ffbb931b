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
#include <string>
#include <string_view>
#include <vector>

namespace tagrow::tagged {

struct TaggedRow {
  uint16_t days{0};
  std::string name;
  std::string path;
  std::vector<std::string> tags;
  uint32_t version{0};
  std::vector<std::string> columns;
};

// Decodes rows written by TaggedRowEncoder. The number of dedicated columns
// is not part of the data and must match the writer's configuration.
// Malformed input throws TagrowUserError with code CORRUPTED_FILE.
class TaggedRowReader {
 public:
  // |data| must outlive *this.
  TaggedRowReader(std::string_view data, size_t dedicatedColumnCount)
      : data_{data}, columnCount_{dedicatedColumnCount} {}

  // Fills |row| with the next row. Returns false once all data is consumed.
  bool next(TaggedRow& row);

  uint64_t offset() const {
    return offset_;
  }

 private:
  uint64_t readVarint();
  std::string_view readBytes(uint64_t size);
  std::string_view readString();

  const std::string_view data_;
  const size_t columnCount_;
  uint64_t offset_{0};
};

// Decodes all rows in |data|.
std::vector<TaggedRow> readTaggedRows(
    std::string_view data,
    size_t dedicatedColumnCount);

} // namespace tagrow::tagged
