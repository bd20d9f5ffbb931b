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
#include "tagrow/tagged/TaggedParser.h"

#include <folly/Conv.h>
#include <folly/ExceptionString.h>
#include <glog/logging.h>

#include <chrono>

#include "tagrow/common/StopWatch.h"
#include "tagrow/tagged/DedupGate.h"
#include "tagrow/tagged/MalformedFilter.h"
#include "tagrow/tagged/TableSchema.h"
#include "tagrow/tagged/TagParser.h"
#include "tagrow/tagged/TaggedRowEncoder.h"

namespace tagrow::tagged {

namespace {
uint32_t unixTimeVersion() {
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}
} // namespace

TaggedParser::TaggedParser(
    const TaggedConfig& config,
    const ExistenceCache& cache,
    BufferPool& bufferPool,
    TaggedParserOptions options)
    : cache_{cache},
      bufferPool_{bufferPool},
      router_{config.dedicatedTags},
      ignored_{config.ignoredMetrics},
      query_{insertQuery(config.tableName, router_.columnNames())},
      logger_{
          options.metricsLogger ? std::move(options.metricsLogger)
                                : std::make_shared<MetricsLogger>()},
      versionProvider_{
          options.versionProvider
              ? std::move(options.versionProvider)
              : std::function<uint32_t()>{unixTimeVersion}} {}

ParseResult TaggedParser::parse(
    rowbinary::RowBinaryReader& reader,
    WriteFile& sink) const {
  StopWatch watch;
  watch.start();

  ParseResult result;
  auto& metrics = result.metrics;
  metrics.fileName = reader.fileName();

  try {
    const uint32_t version = versionProvider_();

    auto rows = bufferPool_.reserveBuffer();
    auto tags = bufferPool_.reserveBuffer();
    DedupGate gate{cache_};
    TaggedRowEncoder encoder{router_, ignored_};
    ParsedMetric metric;

    std::string_view identifier;
    rowbinary::ReadStatus status;
    while ((status = reader.readRecord(identifier)) ==
           rowbinary::ReadStatus::Ok) {
      ++metrics.recordsRead;

      // Plain metrics are loaded by another path.
      if (identifier.find('?') == std::string_view::npos) {
        ++metrics.untaggedRecords;
        continue;
      }
      if (!acceptIdentifier(identifier)) {
        ++metrics.malformedRecords;
        continue;
      }
      if (!gate.shouldProcess(reader.days(), identifier)) {
        ++metrics.duplicateRecords;
        continue;
      }
      if (auto parseStatus = parseTaggedMetric(identifier, metric);
          parseStatus != ParseStatus::Ok) {
        VLOG(1) << "Skipping " << parseStatus << " identifier in "
                << metrics.fileName << " at offset " << reader.offset();
        ++metrics.unparsableRecords;
        continue;
      }

      rows->reset();
      const auto rowCount = encoder.encode(
          reader.days(), identifier, metric, version, *tags, *rows);
      sink.append(rows->bytes());

      ++metrics.metricsWritten;
      metrics.rowsWritten += rowCount;
      metrics.bytesWritten += rows->size();
    }

    metrics.corruptedTail = status == rowbinary::ReadStatus::Corrupted;
    result.newTagged = gate.release();
  } catch (const std::exception& e) {
    logger_->logException(LogOperation::Parse, e.what());
    throw;
  } catch (...) {
    logger_->logException(
        LogOperation::Parse,
        folly::to<std::string>(
            folly::exceptionStr(std::current_exception())));
    throw;
  }

  metrics.wallTimeUsec = watch.elapsedUsec();
  logger_->logFileParse(metrics);
  return result;
}

ParseResult TaggedParser::parseFile(const std::string& path, WriteFile& sink)
    const {
  auto reader = rowbinary::RowBinaryReader::open(path);
  auto result = parse(*reader, sink);
  reader->close();
  return result;
}

} // namespace tagrow::tagged
