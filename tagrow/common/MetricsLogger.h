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

#include <folly/json/dynamic.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace tagrow {

// Outcome of one pass over a record file.
struct FileParseMetrics {
  std::string fileName;

  uint64_t recordsRead{0};
  // Records without a '?', handled by the plain metric path.
  uint64_t untaggedRecords{0};
  // Already in the existence cache or seen earlier in the same file.
  uint64_t duplicateRecords{0};
  // Rejected by the malformed input filter.
  uint64_t malformedRecords{0};
  // Passed the filter but failed to parse.
  uint64_t unparsableRecords{0};

  uint64_t metricsWritten{0};
  uint64_t rowsWritten{0};
  uint64_t bytesWritten{0};

  // The read loop ended on a structurally broken record rather than on a
  // clean end of file.
  bool corruptedTail{false};

  uint64_t wallTimeUsec{0};

  folly::dynamic serialize() const;
};

struct CacheMergeMetrics {
  uint64_t mergedKeys{0};
  uint64_t cacheSize{0};

  folly::dynamic serialize() const;
};

enum class LogOperation {
  Parse,
  Upload,
  CacheMerge,
};

std::string_view toString(LogOperation operation);

class MetricsLogger {
 public:
  virtual ~MetricsLogger() = default;

  virtual void logException(
      LogOperation /* operation */,
      const std::string& /* errorMessage */) const {}

  virtual void logFileParse(const FileParseMetrics& /* metrics */) const {}
  virtual void logCacheMerge(const CacheMergeMetrics& /* metrics */) const {}
};

} // namespace tagrow
