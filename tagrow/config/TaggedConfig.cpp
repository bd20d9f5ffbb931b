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
#include "tagrow/config/TaggedConfig.h"

#include <folly/String.h>
#include <folly/container/F14Set.h>

#include "tagrow/common/Exceptions.h"

DEFINE_string(
    tagrow_table_name,
    "graphite_tagged",
    "Table the tagged rows are loaded into.");

DEFINE_string(
    tagrow_dedicated_tags,
    "",
    "Tags stored in their own column instead of the generic tag array, in the "
    "format: <tag>=<Column>,<tag>=<Column>,...");

DEFINE_string(
    tagrow_ignored_tagged_metrics,
    "",
    "Comma separated base paths for which only the __name__ index row is "
    "written. '*' applies to every metric.");

DEFINE_int64(
    tagrow_cache_ttl_seconds,
    12 * 3600,
    "How long a loaded metric stays in the existence cache.");

DEFINE_uint32(
    tagrow_buffer_pool_size,
    16,
    "Number of idle write buffers kept between file passes.");

namespace tagrow {

namespace {
std::vector<folly::StringPiece> splitEntries(const std::string& str) {
  std::vector<folly::StringPiece> result;
  if (!str.empty()) {
    std::vector<folly::StringPiece> pieces;
    folly::split(',', str, pieces, true);
    for (auto& p : pieces) {
      auto trimmed = folly::trimWhitespace(p);
      if (!trimmed.empty()) {
        result.push_back(trimmed);
      }
    }
  }
  return result;
}
} // namespace

/* static */ std::vector<std::string> TaggedConfig::parseList(
    const std::string& str) {
  std::vector<std::string> result;
  for (auto entry : splitEntries(str)) {
    result.push_back(entry.str());
  }
  return result;
}

/* static */ std::vector<DedicatedTag> TaggedConfig::parseDedicatedTags(
    const std::string& str) {
  std::vector<DedicatedTag> result;
  folly::F14FastSet<std::string> columns;
  for (auto entry : splitEntries(str)) {
    folly::StringPiece tag;
    folly::StringPiece column;
    TAGROW_USER_CHECK(
        folly::split('=', entry, tag, column),
        "Invalid dedicated tag entry '{}', expected <tag>=<Column>.",
        entry.str());
    tag = folly::trimWhitespace(tag);
    column = folly::trimWhitespace(column);
    TAGROW_USER_CHECK(
        !tag.empty() && !column.empty(),
        "Invalid dedicated tag entry '{}', expected <tag>=<Column>.",
        entry.str());
    auto [_, inserted] = columns.insert(column.str());
    TAGROW_USER_CHECK(
        inserted, "Duplicate dedicated column: {}.", column.str());
    result.push_back(DedicatedTag{tag.str(), column.str()});
  }
  return result;
}

/* static */ TaggedConfig TaggedConfig::fromFlags() {
  TAGROW_USER_CHECK(
      !FLAGS_tagrow_table_name.empty(), "Table name must not be empty.");
  TAGROW_USER_CHECK(
      FLAGS_tagrow_cache_ttl_seconds > 0,
      "Cache TTL must be positive, got {}.",
      FLAGS_tagrow_cache_ttl_seconds);
  TAGROW_USER_CHECK(
      FLAGS_tagrow_buffer_pool_size > 0, "Buffer pool size must be positive.");

  TaggedConfig config;
  config.tableName = FLAGS_tagrow_table_name;
  config.dedicatedTags = parseDedicatedTags(FLAGS_tagrow_dedicated_tags);
  config.ignoredMetrics = parseList(FLAGS_tagrow_ignored_tagged_metrics);
  config.cacheTtl = std::chrono::seconds{FLAGS_tagrow_cache_ttl_seconds};
  config.bufferPoolSize = FLAGS_tagrow_buffer_pool_size;
  return config;
}

} // namespace tagrow
