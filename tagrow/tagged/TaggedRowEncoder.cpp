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
#include "tagrow/tagged/TaggedRowEncoder.h"

#include <algorithm>

namespace tagrow::tagged {

TaggedRowEncoder::TaggedRowEncoder(
    const DedicatedTagRouter& router,
    const IgnoredMetrics& ignored)
    : router_{router},
      ignored_{ignored},
      columnValues_(router.columnCount()) {}

/* static */ std::pair<uint64_t, uint64_t> TaggedRowEncoder::writeTag(
    WriteBuffer& tags,
    std::string_view name,
    std::string_view value) {
  const uint64_t size = name.size() + 1 + value.size();
  tags.writeUVarint(size);
  const uint64_t offset = tags.size();
  tags.write(name);
  tags.write("=");
  tags.write(value);
  return {offset, size};
}

uint32_t TaggedRowEncoder::encode(
    uint16_t days,
    std::string_view rawPath,
    const ParsedMetric& metric,
    uint32_t version,
    WriteBuffer& tags,
    WriteBuffer& out) {
  tags.reset();
  indexTags_.clear();
  std::fill(columnValues_.begin(), columnValues_.end(), std::string_view{});

  indexTags_.push_back(writeTag(tags, kNameTag, metric.path));
  uint64_t tagCount = 1;

  const bool nameOnly = ignored_.ignoreAllButName(metric.path);
  for (const auto& tag : metric.tags) {
    if (auto route = router_.classify(tag.name)) {
      columnValues_[route->index] = tag.value;
      continue;
    }
    auto position = writeTag(tags, tag.name, tag.value);
    ++tagCount;
    if (!nameOnly) {
      indexTags_.push_back(position);
    }
  }

  const std::string_view tagArray = tags.bytes();
  for (const auto& [offset, size] : indexTags_) {
    out.writeUint16(days);
    out.writeString(tagArray.substr(offset, size));
    out.writeString(rawPath);
    out.writeUVarint(tagCount);
    out.write(tagArray);
    out.writeUint32(version);
    for (auto value : columnValues_) {
      out.writeString(value);
    }
  }
  return static_cast<uint32_t>(indexTags_.size());
}

} // namespace tagrow::tagged
