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

#include <chrono>
#include <memory>
#include <string>

#include "tagrow/cache/ExistsCache.h"
#include "tagrow/tagged/TaggedParser.h"

namespace tagrow::tagged {

struct UploadResult {
  FileParseMetrics metrics;
  size_t mergedKeys{0};
};

// Runs file passes against a shared ExistsCache. The keys of a pass are
// merged into the cache only after its output was closed without error, so
// a failed pass leaves the cache untouched and its metrics are produced
// again on retry.
//
// Threadsafe: passes over different files may run concurrently.
class TaggedUploader {
 public:
  TaggedUploader(
      const TaggedConfig& config,
      ExistsCache& cache,
      BufferPool& bufferPool,
      TaggedParserOptions options = {});

  // Converts |inputPath| into a new file at |outputPath|.
  UploadResult upload(
      const std::string& inputPath,
      const std::string& outputPath);

  // Converts |inputPath| into |output|, closing it at the end.
  UploadResult upload(const std::string& inputPath, WriteFile& output);

  const std::string& query() const {
    return parser_.query();
  }

  const TaggedParser& parser() const {
    return parser_;
  }

 private:
  ExistsCache& cache_;
  const std::chrono::seconds cacheTtl_;
  std::shared_ptr<const MetricsLogger> logger_;
  const TaggedParser parser_;
};

} // namespace tagrow::tagged
