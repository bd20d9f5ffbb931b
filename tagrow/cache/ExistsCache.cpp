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
#include "tagrow/cache/ExistsCache.h"

#include <algorithm>
#include <functional>

#include "tagrow/common/Exceptions.h"

namespace tagrow {

ExistsCache::ExistsCache(size_t shardCount) {
  TAGROW_CHECK_GT(shardCount, 0, "Cache needs at least one shard.");
  shards_.reserve(shardCount);
  for (size_t i = 0; i < shardCount; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ExistsCache::Shard& ExistsCache::shardFor(std::string_view key) const {
  return *shards_[std::hash<std::string_view>{}(key) % shards_.size()];
}

bool ExistsCache::exists(std::string_view key) const {
  auto rlocked = shardFor(key).rlock();
  return rlocked->find(key) != rlocked->end();
}

void ExistsCache::merge(const KeySet& keys, int64_t expireAt) {
  for (const auto& key : keys) {
    auto wlocked = shardFor(key).wlock();
    auto [it, inserted] = wlocked->emplace(key, expireAt);
    if (!inserted) {
      it->second = std::max(it->second, expireAt);
    }
  }
}

size_t ExistsCache::expire(int64_t now) {
  size_t removed = 0;
  std::vector<std::string> expired;
  for (auto& shard : shards_) {
    auto wlocked = shard->wlock();
    expired.clear();
    for (const auto& [key, expireAt] : *wlocked) {
      if (expireAt <= now) {
        expired.push_back(key);
      }
    }
    for (const auto& key : expired) {
      wlocked->erase(key);
    }
    removed += expired.size();
  }
  return removed;
}

size_t ExistsCache::count() const {
  size_t total = 0;
  for (const auto& shard : shards_) {
    total += shard->rlock()->size();
  }
  return total;
}

void ExistsCache::clear() {
  for (auto& shard : shards_) {
    shard->wlock()->clear();
  }
}

} // namespace tagrow
