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

#include <cstddef>
#include <string_view>

namespace tagrow::tagged {

enum class MalformedReason {
  None,
  TooLong,
  BadLeadingCharacter,
};

std::string_view toString(MalformedReason reason);

constexpr size_t kMaxIdentifierLength = 1000;

inline bool isAsciiLetter(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// Pure classification, no logging.
inline MalformedReason checkIdentifier(std::string_view identifier) {
  if (identifier.size() > kMaxIdentifierLength) {
    return MalformedReason::TooLong;
  }
  if (!identifier.empty() && !isAsciiLetter(identifier.front())) {
    return MalformedReason::BadLeadingCharacter;
  }
  return MalformedReason::None;
}

// Returns false, and logs a warning with the escaped identifier, if
// |identifier| must be skipped.
bool acceptIdentifier(std::string_view identifier);

} // namespace tagrow::tagged
