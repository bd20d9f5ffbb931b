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
#include "tagrow/common/DefaultMetricsLogger.h"

#include <folly/json/json.h>
#include <glog/logging.h>

namespace tagrow {

DefaultMetricsLogger::DefaultMetricsLogger(std::string table)
    : table_{std::move(table)} {}

void DefaultMetricsLogger::logException(
    LogOperation operation,
    const std::string& errorMessage) const {
  LOG(ERROR) << "[" << table_ << "] " << toString(operation)
             << " failed: " << errorMessage;
}

void DefaultMetricsLogger::logFileParse(
    const FileParseMetrics& metrics) const {
  auto obj = metrics.serialize();
  obj["table"] = table_;
  obj["operation"] = std::string{toString(LogOperation::Parse)};
  LOG(INFO) << folly::toJson(obj);
}

void DefaultMetricsLogger::logCacheMerge(
    const CacheMergeMetrics& metrics) const {
  auto obj = metrics.serialize();
  obj["table"] = table_;
  obj["operation"] = std::string{toString(LogOperation::CacheMerge)};
  LOG(INFO) << folly::toJson(obj);
}

} // namespace tagrow
