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
#include "tagrow/tagged/TaggedRowReader.h"

#include "tagrow/common/EncodingPrimitives.h"
#include "tagrow/common/Exceptions.h"
#include "tagrow/common/Varint.h"

namespace tagrow::tagged {

uint64_t TaggedRowReader::readVarint() {
  const char* pos = data_.data() + offset_;
  uint64_t value;
  const auto status =
      varint::tryReadVarint64(&pos, data_.data() + data_.size(), value);
  TAGROW_CHECK_FILE(
      status == varint::VarintStatus::Ok,
      "Invalid varint at offset {}.",
      offset_);
  offset_ = pos - data_.data();
  return value;
}

std::string_view TaggedRowReader::readBytes(uint64_t size) {
  TAGROW_CHECK_FILE(
      size <= data_.size() - offset_,
      "Row truncated at offset {}: {} bytes needed, {} left.",
      offset_,
      size,
      data_.size() - offset_);
  auto bytes = data_.substr(offset_, size);
  offset_ += size;
  return bytes;
}

std::string_view TaggedRowReader::readString() {
  return readBytes(readVarint());
}

bool TaggedRowReader::next(TaggedRow& row) {
  if (offset_ == data_.size()) {
    return false;
  }

  const char* pos = readBytes(sizeof(uint16_t)).data();
  row.days = encoding::readUint16(pos);
  row.name = readString();
  row.path = readString();

  const auto tagCount = readVarint();
  // Each tag takes at least one byte.
  TAGROW_CHECK_FILE(
      tagCount <= data_.size() - offset_,
      "Invalid tag count {} at offset {}.",
      tagCount,
      offset_);
  row.tags.clear();
  row.tags.reserve(tagCount);
  for (uint64_t i = 0; i < tagCount; ++i) {
    row.tags.emplace_back(readString());
  }

  pos = readBytes(sizeof(uint32_t)).data();
  row.version = encoding::readUint32(pos);

  row.columns.clear();
  for (size_t i = 0; i < columnCount_; ++i) {
    row.columns.emplace_back(readString());
  }
  return true;
}

std::vector<TaggedRow> readTaggedRows(
    std::string_view data,
    size_t dedicatedColumnCount) {
  TaggedRowReader reader{data, dedicatedColumnCount};
  std::vector<TaggedRow> rows;
  TaggedRow row;
  while (reader.next(row)) {
    rows.push_back(row);
  }
  return rows;
}

} // namespace tagrow::tagged
