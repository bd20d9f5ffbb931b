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
#include <functional>
#include <memory>
#include <string>

#include "tagrow/cache/ExistenceCache.h"
#include "tagrow/common/BufferPool.h"
#include "tagrow/common/File.h"
#include "tagrow/common/MetricsLogger.h"
#include "tagrow/config/TaggedConfig.h"
#include "tagrow/rowbinary/RowBinaryReader.h"
#include "tagrow/tagged/DedicatedTagRouter.h"
#include "tagrow/tagged/IgnoredMetrics.h"

namespace tagrow::tagged {

struct TaggedParserOptions {
  std::shared_ptr<const MetricsLogger> metricsLogger;

  // Returns the version stamped on the rows of a pass. Defaults to the
  // current unix time truncated to 32 bits.
  std::function<uint32_t()> versionProvider;
};

struct ParseResult {
  // Keys of the metrics written by the pass. To be merged into the
  // existence cache once the output is safely stored.
  KeySet newTagged;
  FileParseMetrics metrics;
};

// Converts record files into tagged table rows.
//
// For each record: untagged identifiers, malformed identifiers and metrics
// the existence cache or the current pass already know are skipped. The
// rest are parsed, and all their rows are written to the sink in one
// append() call.
//
// A parser is immutable after construction and may run passes for several
// files concurrently. Each pass leases its own buffers from the pool.
class TaggedParser {
 public:
  TaggedParser(
      const TaggedConfig& config,
      const ExistenceCache& cache,
      BufferPool& bufferPool,
      TaggedParserOptions options = {});

  // Runs a pass over the records left in |reader|. A corrupted tail ends the
  // pass normally and is reported in the metrics. Errors raised by |sink|
  // propagate; everything appended before stays in the sink.
  ParseResult parse(rowbinary::RowBinaryReader& reader, WriteFile& sink) const;

  // Opens |path| and runs a pass over it. Failing to open is an error.
  ParseResult parseFile(const std::string& path, WriteFile& sink) const;

  // Insert statement matching the rows this parser writes.
  const std::string& query() const {
    return query_;
  }

  const DedicatedTagRouter& router() const {
    return router_;
  }

 private:
  const ExistenceCache& cache_;
  BufferPool& bufferPool_;
  const DedicatedTagRouter router_;
  const IgnoredMetrics ignored_;
  const std::string query_;
  std::shared_ptr<const MetricsLogger> logger_;
  std::function<uint32_t()> versionProvider_;
};

} // namespace tagrow::tagged
