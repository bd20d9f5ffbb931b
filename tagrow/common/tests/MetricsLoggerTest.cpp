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
#include <gtest/gtest.h>

#include "tagrow/common/DefaultMetricsLogger.h"
#include "tagrow/common/MetricsLogger.h"

namespace tagrow::test {

// --- FileParseMetrics::serialize ---

TEST(MetricsLoggerTest, FileParseMetricsSerialize) {
  FileParseMetrics metrics{
      .fileName = "points.bin",
      .recordsRead = 100,
      .untaggedRecords = 10,
      .duplicateRecords = 20,
      .malformedRecords = 3,
      .unparsableRecords = 2,
      .metricsWritten = 65,
      .rowsWritten = 180,
      .bytesWritten = 9000,
      .corruptedTail = true,
      .wallTimeUsec = 42,
  };

  auto obj = metrics.serialize();
  EXPECT_EQ(obj["fileName"].asString(), "points.bin");
  EXPECT_EQ(obj["recordsRead"].asInt(), 100);
  EXPECT_EQ(obj["untaggedRecords"].asInt(), 10);
  EXPECT_EQ(obj["duplicateRecords"].asInt(), 20);
  EXPECT_EQ(obj["malformedRecords"].asInt(), 3);
  EXPECT_EQ(obj["unparsableRecords"].asInt(), 2);
  EXPECT_EQ(obj["metricsWritten"].asInt(), 65);
  EXPECT_EQ(obj["rowsWritten"].asInt(), 180);
  EXPECT_EQ(obj["bytesWritten"].asInt(), 9000);
  EXPECT_TRUE(obj["corruptedTail"].asBool());
  EXPECT_EQ(obj["wallTimeUsec"].asInt(), 42);
}

TEST(MetricsLoggerTest, FileParseMetricsSerializeDefaults) {
  FileParseMetrics metrics;
  auto obj = metrics.serialize();
  EXPECT_EQ(obj["fileName"].asString(), "");
  EXPECT_EQ(obj["rowsWritten"].asInt(), 0);
  EXPECT_FALSE(obj["corruptedTail"].asBool());
}

// --- CacheMergeMetrics::serialize ---

TEST(MetricsLoggerTest, CacheMergeMetricsSerialize) {
  CacheMergeMetrics metrics{
      .mergedKeys = 7,
      .cacheSize = 1000,
  };
  auto obj = metrics.serialize();
  EXPECT_EQ(obj["mergedKeys"].asInt(), 7);
  EXPECT_EQ(obj["cacheSize"].asInt(), 1000);
}

// --- LogOperation ---

TEST(MetricsLoggerTest, LogOperationToString) {
  EXPECT_EQ(toString(LogOperation::Parse), "PARSE");
  EXPECT_EQ(toString(LogOperation::Upload), "UPLOAD");
  EXPECT_EQ(toString(LogOperation::CacheMerge), "CACHE_MERGE");
}

// --- Loggers accept every record without throwing ---

TEST(MetricsLoggerTest, BaseLoggerIsNoop) {
  MetricsLogger logger;
  logger.logException(LogOperation::Parse, "test error");
  logger.logFileParse(FileParseMetrics{});
  logger.logCacheMerge(CacheMergeMetrics{});
}

TEST(MetricsLoggerTest, DefaultLogger) {
  DefaultMetricsLogger logger{"graphite_tagged"};
  logger.logException(LogOperation::Upload, "test error");
  logger.logFileParse(FileParseMetrics{.fileName = "a", .recordsRead = 1});
  logger.logCacheMerge(CacheMergeMetrics{.mergedKeys = 1, .cacheSize = 1});
}

} // namespace tagrow::test
