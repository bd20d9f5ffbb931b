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

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Parsing of tagged metric identifiers:
//
//   <base-path>?<name>=<value>&<name>=<value>...[#fragment]
//
// The base path is percent-decoded as a path component ('+' stays literal).
// The query string is decoded the way HTML forms encode it ('+' is a space).

namespace tagrow::tagged {

struct Tag {
  std::string name;
  std::string value;
};

struct ParsedMetric {
  // Decoded base path. This is the value of the __name__ tag.
  std::string path;
  // Tags in order of first occurrence. Names are unique.
  std::vector<Tag> tags;

  // Returns the value of tag |name|, or nullptr if the metric doesn't carry
  // it.
  const std::string* find(std::string_view name) const;

  void clear() {
    path.clear();
    tags.clear();
  }
};

enum class ParseStatus {
  Ok,
  // No '?' in the identifier.
  NotTagged,
  // Invalid percent escape in the base path.
  MalformedPath,
  // Invalid percent escape in the fragment.
  MalformedFragment,
  // Byte below 0x20 or 0x7f between the '?' and the fragment.
  InvalidControlCharacter,
};

std::string_view toString(ParseStatus status);

inline std::ostream& operator<<(std::ostream& os, ParseStatus status) {
  return os << toString(status);
}

// Splits |identifier| into |out|. |out| is cleared first and is only
// meaningful when Ok is returned.
//
// Query pairs that fail to decode, or that contain ';', are dropped without
// failing the identifier. When a tag name repeats, the first value is kept
// and the others are ignored.
ParseStatus parseTaggedMetric(
    std::string_view identifier,
    ParsedMetric& out);

} // namespace tagrow::tagged
