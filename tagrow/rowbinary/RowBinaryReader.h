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
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "tagrow/common/File.h"

namespace tagrow::rowbinary {

enum class ReadStatus {
  Ok,
  // Clean end of input, right after the last complete record.
  EndOfFile,
  // The remaining bytes do not form a complete record. Everything returned
  // before is valid.
  Corrupted,
};

std::string_view toString(ReadStatus status);

inline std::ostream& operator<<(std::ostream& os, ReadStatus status) {
  return os << toString(status);
}

/// Sequential reader over a file of points records, as written by the
/// receiving side of the pipeline. Each record is
///
///   [path: uvarint length + bytes][value: Float64][timestamp: UInt32]
///
/// all little endian. The reader buffers the file in large chunks and hands
/// out views into that buffer, so the path returned by readRecord() is only
/// valid until the next readRecord() or close() call.
class RowBinaryReader {
 public:
  explicit RowBinaryReader(
      std::unique_ptr<ReadFile> file,
      uint64_t bufferSize = kDefaultBufferSize);

  // Opens the local file at |path|. Throws TagrowExternalError when the file
  // can't be opened.
  static std::unique_ptr<RowBinaryReader> open(const std::string& path);

  RowBinaryReader(const RowBinaryReader&) = delete;
  RowBinaryReader& operator=(const RowBinaryReader&) = delete;

  // Decodes the next record. On Ok, |path| views the record's identifier and
  // days()/timestamp()/value() describe it. EndOfFile and Corrupted are
  // terminal: every later call returns the same status.
  ReadStatus readRecord(std::string_view& path);

  // Day bucket of the last record returned: days since 1970-01-01 UTC,
  // truncated to 16 bits.
  uint16_t days() const {
    return days_;
  }

  uint32_t timestamp() const {
    return timestamp_;
  }

  double value() const {
    return value_;
  }

  // Offset in the file right after the last record returned.
  uint64_t offset() const {
    return recordEnd_;
  }

  const std::string& fileName() const {
    return fileName_;
  }

  // Releases the file and the buffer. Further reads return EndOfFile.
  void close();

  static uint16_t daysFromTimestamp(uint32_t timestamp) {
    return static_cast<uint16_t>(timestamp / kSecondsPerDay);
  }

 private:
  static constexpr uint64_t kDefaultBufferSize = 1 << 20;
  static constexpr uint32_t kSecondsPerDay = 86400;
  // Value + timestamp following the path.
  static constexpr uint64_t kRecordTailSize = sizeof(double) + sizeof(uint32_t);

  // Bytes not yet decoded, buffered or not.
  uint64_t remaining() const {
    return (bufferEnd_ - bufferPos_) + (fileSize_ - fileOffset_);
  }

  // Makes at least |bytes| contiguous bytes available at bufferPos_.
  // |bytes| must not exceed remaining(). Returns false if the file ended
  // early.
  bool ensureBuffered(uint64_t bytes);

  ReadStatus fail(ReadStatus status);

  std::unique_ptr<ReadFile> file_;
  const std::string fileName_;
  const uint64_t fileSize_;
  uint64_t fileOffset_{0};

  std::unique_ptr<char[]> buffer_;
  uint64_t bufferCapacity_;
  uint64_t bufferPos_{0};
  uint64_t bufferEnd_{0};

  ReadStatus status_{ReadStatus::Ok};
  uint64_t recordEnd_{0};
  uint16_t days_{0};
  uint32_t timestamp_{0};
  double value_{0};
};

} // namespace tagrow::rowbinary
