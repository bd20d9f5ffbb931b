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
#include "tagrow/tools/TagrowToolLib.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <folly/Conv.h>
#include <folly/FileUtil.h>
#include <folly/String.h>

#include <cerrno>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <tuple>

#include "tagrow/cache/ExistsCache.h"
#include "tagrow/common/BufferPool.h"
#include "tagrow/common/DefaultMetricsLogger.h"
#include "tagrow/common/Exceptions.h"
#include "tagrow/rowbinary/RowBinaryReader.h"
#include "tagrow/tagged/TaggedRowReader.h"
#include "tagrow/tagged/TaggedUploader.h"

namespace tagrow::tools {
#define YELLOW "\033[33m"
#define RESET_COLOR "\033[0m"

namespace {

constexpr std::string_view kOutputExtension = ".rowbinary";

enum class Alignment {
  Left,
  Right,
};

class TableFormatter {
 public:
  TableFormatter(
      std::ostream& ostream,
      std::vector<std::tuple<
          std::string /* Title */,
          uint8_t /* Width */,
          Alignment /* Horizontal Alignment */
          >> fields,
      bool noHeader = false,
      const std::string& separator = "\t")
      : ostream_{ostream}, fields_{std::move(fields)}, separator_{separator} {
    if (!noHeader) {
      ostream << YELLOW;
      for (const auto& field : fields_) {
        ostream << (std::get<2>(field) == Alignment::Right ? std::right
                                                           : std::left)
                << std::setw(std::get<1>(field)) << std::get<0>(field)
                << ((&field != &fields_.back()) ? separator_ : "");
      }
      ostream << RESET_COLOR << std::endl;
    }
  }

  void writeRow(const std::vector<std::string>& values) {
    TAGROW_CHECK_EQ(values.size(), fields_.size(), "Row width mismatch.");
    for (size_t i = 0; i < values.size(); ++i) {
      ostream_ << (std::get<2>(fields_[i]) == Alignment::Right ? std::right
                                                               : std::left)
               << std::setw(std::get<1>(fields_[i])) << values[i]
               << (i != values.size() - 1 ? separator_ : "");
    }
    ostream_ << std::endl;
  }

 private:
  std::ostream& ostream_;
  std::vector<std::tuple<
      std::string /* Title */,
      uint8_t /* Width */,
      Alignment /* Horizontal Alignment */
      >>
      fields_;
  const std::string separator_;
};

// Identifiers may hold any byte.
std::string printable(std::string_view value) {
  return folly::cEscape<std::string>(
      folly::StringPiece{value.data(), value.size()});
}

} // namespace

void TagrowToolLib::emitConvert(
    const std::vector<std::string>& inputs,
    const std::string& outputDir,
    const TaggedConfig& config,
    bool noHeader) {
  ExistsCache cache;
  BufferPool bufferPool{config.bufferPoolSize};
  tagged::TaggedUploader uploader{
      config,
      cache,
      bufferPool,
      tagged::TaggedParserOptions{
          .metricsLogger =
              std::make_shared<DefaultMetricsLogger>(config.tableName)}};

  ostream_ << uploader.query() << std::endl;

  TableFormatter formatter(
      ostream_,
      {
          {"Input", 40, Alignment::Left},
          {"Output", 40, Alignment::Left},
          {"Records", 10, Alignment::Right},
          {"Metrics", 10, Alignment::Right},
          {"Rows", 10, Alignment::Right},
          {"Bytes", 12, Alignment::Right},
          {"Skipped", 10, Alignment::Right},
          {"Corrupted", 9, Alignment::Left},
      },
      noHeader);

  for (const auto& input : inputs) {
    auto output = (std::filesystem::path{outputDir} /
                   std::filesystem::path{input}.filename())
                      .string();
    output += kOutputExtension;

    const auto result = uploader.upload(input, output);
    const auto& metrics = result.metrics;
    formatter.writeRow({
        input,
        output,
        folly::to<std::string>(metrics.recordsRead),
        folly::to<std::string>(metrics.metricsWritten),
        folly::to<std::string>(metrics.rowsWritten),
        folly::to<std::string>(metrics.bytesWritten),
        folly::to<std::string>(
            metrics.untaggedRecords + metrics.duplicateRecords +
            metrics.malformedRecords + metrics.unparsableRecords),
        metrics.corruptedTail ? "yes" : "no",
    });
  }
}

void TagrowToolLib::emitRows(
    const std::string& file,
    size_t dedicatedColumnCount,
    bool noHeader,
    std::optional<uint64_t> limit) {
  std::string data;
  if (!folly::readFile(file.c_str(), data)) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to read {}: {}",
        file,
        folly::errnoStr(errno));
  }

  TableFormatter formatter(
      ostream_,
      {
          {"Date", 6, Alignment::Right},
          {"Version", 10, Alignment::Right},
          {"Name", 30, Alignment::Left},
          {"Path", 50, Alignment::Left},
          {"Tags", 50, Alignment::Left},
          {"Columns", 20, Alignment::Left},
      },
      noHeader);

  tagged::TaggedRowReader reader{data, dedicatedColumnCount};
  tagged::TaggedRow row;
  uint64_t count = 0;
  while ((!limit || count < *limit) && reader.next(row)) {
    std::vector<std::string> tags;
    tags.reserve(row.tags.size());
    for (const auto& tag : row.tags) {
      tags.push_back(printable(tag));
    }
    std::vector<std::string> columns;
    columns.reserve(row.columns.size());
    for (const auto& column : row.columns) {
      columns.push_back(printable(column));
    }
    formatter.writeRow({
        folly::to<std::string>(row.days),
        folly::to<std::string>(row.version),
        printable(row.name),
        printable(row.path),
        fmt::format("[{}]", fmt::join(tags, ", ")),
        fmt::format("[{}]", fmt::join(columns, ", ")),
    });
    ++count;
  }
}

void TagrowToolLib::emitRecords(
    const std::string& file,
    bool noHeader,
    std::optional<uint64_t> limit) {
  auto reader = rowbinary::RowBinaryReader::open(file);

  TableFormatter formatter(
      ostream_,
      {
          {"Offset", 12, Alignment::Right},
          {"Date", 6, Alignment::Right},
          {"Timestamp", 10, Alignment::Right},
          {"Value", 16, Alignment::Right},
          {"Path", 60, Alignment::Left},
      },
      noHeader);

  std::string_view path;
  uint64_t count = 0;
  uint64_t offset = 0;
  rowbinary::ReadStatus status = rowbinary::ReadStatus::Ok;
  while ((!limit || count < *limit) &&
         (status = reader->readRecord(path)) == rowbinary::ReadStatus::Ok) {
    formatter.writeRow({
        folly::to<std::string>(offset),
        folly::to<std::string>(reader->days()),
        folly::to<std::string>(reader->timestamp()),
        fmt::format("{}", reader->value()),
        printable(path),
    });
    offset = reader->offset();
    ++count;
  }
  if (status == rowbinary::ReadStatus::Corrupted) {
    ostream_ << "Corrupted record at offset " << reader->offset() << std::endl;
  }
}

} // namespace tagrow::tools
