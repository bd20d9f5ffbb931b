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
#include "tagrow/common/MetricsLogger.h"

#include "tagrow/common/Exceptions.h"

namespace tagrow {

folly::dynamic FileParseMetrics::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["fileName"] = fileName;
  obj["recordsRead"] = recordsRead;
  obj["untaggedRecords"] = untaggedRecords;
  obj["duplicateRecords"] = duplicateRecords;
  obj["malformedRecords"] = malformedRecords;
  obj["unparsableRecords"] = unparsableRecords;
  obj["metricsWritten"] = metricsWritten;
  obj["rowsWritten"] = rowsWritten;
  obj["bytesWritten"] = bytesWritten;
  obj["corruptedTail"] = corruptedTail;
  obj["wallTimeUsec"] = wallTimeUsec;
  return obj;
}

folly::dynamic CacheMergeMetrics::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["mergedKeys"] = mergedKeys;
  obj["cacheSize"] = cacheSize;
  return obj;
}

std::string_view toString(LogOperation operation) {
  switch (operation) {
    case LogOperation::Parse:
      return "PARSE";
    case LogOperation::Upload:
      return "UPLOAD";
    case LogOperation::CacheMerge:
      return "CACHE_MERGE";
  }
  TAGROW_UNREACHABLE(
      "Unknown log operation: {}", static_cast<int>(operation));
}

} // namespace tagrow
