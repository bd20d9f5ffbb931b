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

#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tagrow/cache/ExistenceCache.h"

namespace tagrow {

// In-process existence cache. Keys live until their deadline passes and
// expire() is called with a later time. Keys are spread over independently
// locked shards, so concurrent passes mostly don't contend.
class ExistsCache final : public ExistenceCache {
 public:
  static constexpr size_t kDefaultShardCount = 64;

  explicit ExistsCache(size_t shardCount = kDefaultShardCount);

  bool exists(std::string_view key) const override;

  // Adds |keys| with deadline |expireAt| (seconds since epoch). A key already
  // present gets the later of both deadlines.
  void merge(const KeySet& keys, int64_t expireAt);

  // Removes the keys whose deadline is at or before |now|. Returns the number
  // of keys removed.
  size_t expire(int64_t now);

  size_t count() const;

  void clear();

 private:
  using Shard = folly::Synchronized<folly::F14FastMap<std::string, int64_t>>;

  Shard& shardFor(std::string_view key) const;

  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace tagrow
