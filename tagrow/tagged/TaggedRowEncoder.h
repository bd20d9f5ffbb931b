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
#include <utility>
#include <vector>

#include "tagrow/common/Buffer.h"
#include "tagrow/tagged/DedicatedTagRouter.h"
#include "tagrow/tagged/IgnoredMetrics.h"
#include "tagrow/tagged/TagParser.h"

namespace tagrow::tagged {

// Expands one parsed metric into its index rows. Every row has the layout
//
//   Date      UInt16         day bucket
//   Name      String         the "name=value" tag this row indexes
//   Path      String         raw identifier
//   Tags      Array(String)  __name__ and every generic tag
//   Version   UInt32
//   <column>  String         one per dedicated column, "" when absent
//
// The first row indexes __name__=<path>. One more row follows per generic
// tag, unless the path is ignored, in which case __name__ is the only row.
// Rows of a metric differ only in Name.
//
// Not threadsafe: scratch state is reused between encode() calls.
class TaggedRowEncoder {
 public:
  static constexpr std::string_view kNameTag = "__name__";

  TaggedRowEncoder(
      const DedicatedTagRouter& router,
      const IgnoredMetrics& ignored);

  // Appends the rows of |metric| to |out| and returns how many were
  // appended. |tags| is scratch space for the tag array.
  uint32_t encode(
      uint16_t days,
      std::string_view rawPath,
      const ParsedMetric& metric,
      uint32_t version,
      WriteBuffer& tags,
      WriteBuffer& out);

 private:
  // Writes "name=value" as a length prefixed string into |tags|. Returns the
  // position and size of the text, without the prefix.
  static std::pair<uint64_t, uint64_t>
  writeTag(WriteBuffer& tags, std::string_view name, std::string_view value);

  const DedicatedTagRouter& router_;
  const IgnoredMetrics& ignored_;

  // Offsets into the tag array scratch of the tags that get a row.
  std::vector<std::pair<uint64_t, uint64_t>> indexTags_;
  std::vector<std::string_view> columnValues_;
};

} // namespace tagrow::tagged
