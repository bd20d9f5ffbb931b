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
#include "tagrow/tagged/DedupGate.h"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace tagrow::tagged {

namespace {
void formatKey(uint16_t days, std::string_view identifier, std::string& out) {
  out.clear();
  fmt::format_to(std::back_inserter(out), "{}:{}", days, identifier);
}
} // namespace

std::string dedupKey(uint16_t days, std::string_view identifier) {
  std::string key;
  formatKey(days, identifier, key);
  return key;
}

bool DedupGate::shouldProcess(uint16_t days, std::string_view identifier) {
  formatKey(days, identifier, key_);
  if (cache_.exists(key_)) {
    return false;
  }
  return seen_.insert(key_).second;
}

KeySet DedupGate::release() {
  KeySet released;
  std::swap(released, seen_);
  return released;
}

} // namespace tagrow::tagged
