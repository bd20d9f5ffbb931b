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

#include "tagrow/cache/ExistenceCache.h"

namespace tagrow::tagged {

// Formats the dedup key of a record: "<days>:<identifier>".
std::string dedupKey(uint16_t days, std::string_view identifier);

// Lets each (day, identifier) pair through at most once per pass, and never
// when the existence cache already has it. Owned by a single pass, not
// threadsafe. The existence cache is only read.
class DedupGate {
 public:
  explicit DedupGate(const ExistenceCache& cache) : cache_{cache} {}

  DedupGate(const DedupGate&) = delete;
  DedupGate& operator=(const DedupGate&) = delete;

  // Returns true the first time a pair unknown to the cache is seen, and
  // records it.
  bool shouldProcess(uint16_t days, std::string_view identifier);

  // Keys let through so far.
  const KeySet& seen() const {
    return seen_;
  }

  // Hands over the keys let through so far and starts over.
  KeySet release();

 private:
  const ExistenceCache& cache_;
  KeySet seen_;
  // Reused between calls.
  std::string key_;
};

} // namespace tagrow::tagged
