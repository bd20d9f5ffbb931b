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

#include "tagrow/common/MetricsLogger.h"

namespace tagrow {

// Writes every metrics record as one JSON line to the glog INFO stream,
// tagged with the table the pass is loading into.
class DefaultMetricsLogger : public MetricsLogger {
 public:
  explicit DefaultMetricsLogger(std::string table);

  void logException(LogOperation operation, const std::string& errorMessage)
      const override;

  void logFileParse(const FileParseMetrics& metrics) const override;
  void logCacheMerge(const CacheMergeMetrics& metrics) const override;

 private:
  std::string table_;
};

} // namespace tagrow
