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

#include <gflags/gflags.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

DECLARE_string(tagrow_table_name);
DECLARE_string(tagrow_dedicated_tags);
DECLARE_string(tagrow_ignored_tagged_metrics);
DECLARE_int64(tagrow_cache_ttl_seconds);
DECLARE_uint32(tagrow_buffer_pool_size);

namespace tagrow {

// A tag promoted to its own column in the tagged table.
struct DedicatedTag {
  std::string tag;
  std::string column;
};

// Static configuration of the tagged table loader. Built once, immutable for
// the lifetime of the process.
struct TaggedConfig {
  std::string tableName{"graphite_tagged"};

  // Column order is the order of the extra columns in every output row.
  std::vector<DedicatedTag> dedicatedTags;

  // Base paths for which only the __name__ index row is written. "*" matches
  // every metric.
  std::vector<std::string> ignoredMetrics;

  // How long a key merged into the existence cache stays there.
  std::chrono::seconds cacheTtl{std::chrono::hours{12}};

  // Idle write buffers kept around between passes.
  uint32_t bufferPoolSize{16};

  // Builds a config from the --tagrow_* flags. Throws TagrowUserError on
  // invalid values.
  static TaggedConfig fromFlags();

  // Parses "tag=Column,tag=Column,...". Entries are trimmed, empty entries
  // are skipped. A missing '=', an empty side or a repeated column name is a
  // user error.
  static std::vector<DedicatedTag> parseDedicatedTags(const std::string& str);

  // Parses a comma separated list, trimming and skipping empty entries.
  static std::vector<std::string> parseList(const std::string& str);
};

} // namespace tagrow
