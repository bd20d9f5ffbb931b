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
#include "tagrow/tagged/TaggedUploader.h"

#include <glog/logging.h>

namespace tagrow::tagged {

namespace {
std::shared_ptr<const MetricsLogger> orDefault(
    std::shared_ptr<const MetricsLogger> logger) {
  return logger ? std::move(logger) : std::make_shared<MetricsLogger>();
}
} // namespace

TaggedUploader::TaggedUploader(
    const TaggedConfig& config,
    ExistsCache& cache,
    BufferPool& bufferPool,
    TaggedParserOptions options)
    : cache_{cache},
      cacheTtl_{config.cacheTtl},
      logger_{orDefault(options.metricsLogger)},
      parser_{
          config,
          cache,
          bufferPool,
          TaggedParserOptions{logger_, std::move(options.versionProvider)}} {}

UploadResult TaggedUploader::upload(
    const std::string& inputPath,
    const std::string& outputPath) {
  LocalWriteFile output{outputPath};
  return upload(inputPath, output);
}

UploadResult TaggedUploader::upload(
    const std::string& inputPath,
    WriteFile& output) {
  std::unique_ptr<rowbinary::RowBinaryReader> reader;
  try {
    reader = rowbinary::RowBinaryReader::open(inputPath);
  } catch (const std::exception& e) {
    logger_->logException(LogOperation::Upload, e.what());
    throw;
  }

  // Failures during the pass are logged by the parser.
  auto parsed = parser_.parse(*reader, output);

  try {
    reader->close();
    output.close();
  } catch (const std::exception& e) {
    logger_->logException(LogOperation::Upload, e.what());
    throw;
  }

  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  cache_.merge(parsed.newTagged, now + cacheTtl_.count());

  CacheMergeMetrics mergeMetrics{
      .mergedKeys = parsed.newTagged.size(),
      .cacheSize = cache_.count(),
  };
  logger_->logCacheMerge(mergeMetrics);
  VLOG(1) << "Loaded " << inputPath << ": "
          << parsed.metrics.metricsWritten << " metrics, "
          << parsed.metrics.rowsWritten << " rows";

  return UploadResult{
      .metrics = std::move(parsed.metrics),
      .mergedKeys = mergeMetrics.mergedKeys,
  };
}

} // namespace tagrow::tagged
