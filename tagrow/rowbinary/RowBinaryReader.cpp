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
#include "tagrow/rowbinary/RowBinaryReader.h"

#include <glog/logging.h>

#include <algorithm>
#include <cstring>

#include "tagrow/common/EncodingPrimitives.h"
#include "tagrow/common/Exceptions.h"
#include "tagrow/common/Varint.h"

namespace tagrow::rowbinary {

std::string_view toString(ReadStatus status) {
  switch (status) {
    case ReadStatus::Ok:
      return "Ok";
    case ReadStatus::EndOfFile:
      return "EndOfFile";
    case ReadStatus::Corrupted:
      return "Corrupted";
  }
  TAGROW_UNREACHABLE("Unknown read status: {}", static_cast<int>(status));
}

RowBinaryReader::RowBinaryReader(
    std::unique_ptr<ReadFile> file,
    uint64_t bufferSize)
    : file_{std::move(file)},
      fileName_{file_->name()},
      fileSize_{file_->size()},
      bufferCapacity_{std::max<uint64_t>(bufferSize, 64)} {
  buffer_.reset(new char[bufferCapacity_]);
}

std::unique_ptr<RowBinaryReader> RowBinaryReader::open(
    const std::string& path) {
  return std::make_unique<RowBinaryReader>(
      std::make_unique<LocalReadFile>(path));
}

bool RowBinaryReader::ensureBuffered(uint64_t bytes) {
  const uint64_t buffered = bufferEnd_ - bufferPos_;
  if (buffered >= bytes) {
    return true;
  }
  TAGROW_DCHECK_LE(bytes, remaining());

  if (bytes > bufferCapacity_) {
    // A single record larger than the buffer. Grow to fit it.
    auto newCapacity = std::max(bytes, bufferCapacity_ * 2);
    std::unique_ptr<char[]> newBuffer{new char[newCapacity]};
    std::memcpy(newBuffer.get(), buffer_.get() + bufferPos_, buffered);
    buffer_ = std::move(newBuffer);
    bufferCapacity_ = newCapacity;
  } else if (buffered > 0) {
    std::memmove(buffer_.get(), buffer_.get() + bufferPos_, buffered);
  }
  bufferPos_ = 0;
  bufferEnd_ = buffered;

  while (bufferEnd_ < bytes) {
    const auto toRead =
        std::min(bufferCapacity_ - bufferEnd_, fileSize_ - fileOffset_);
    const auto bytesRead =
        file_->pread(fileOffset_, toRead, buffer_.get() + bufferEnd_);
    if (bytesRead == 0) {
      // The file got shorter than its size at open time.
      LOG(WARNING) << "Unexpected end of " << fileName_ << " at offset "
                   << fileOffset_;
      return false;
    }
    fileOffset_ += bytesRead;
    bufferEnd_ += bytesRead;
  }
  return true;
}

ReadStatus RowBinaryReader::fail(ReadStatus status) {
  if (status == ReadStatus::Corrupted) {
    LOG(WARNING) << "Corrupted record in " << fileName_ << " at offset "
                 << recordEnd_ << ", " << remaining()
                 << " trailing bytes ignored";
  }
  status_ = status;
  return status;
}

ReadStatus RowBinaryReader::readRecord(std::string_view& path) {
  if (status_ != ReadStatus::Ok) {
    return status_;
  }
  if (!file_) {
    return fail(ReadStatus::EndOfFile);
  }

  const uint64_t available = remaining();
  if (available == 0) {
    return fail(ReadStatus::EndOfFile);
  }

  if (!ensureBuffered(
          std::min<uint64_t>(varint::kMaxVarintLength64, available))) {
    return fail(ReadStatus::Corrupted);
  }
  const char* begin = buffer_.get() + bufferPos_;
  const char* pos = begin;
  uint64_t pathLength;
  if (varint::tryReadVarint64(&pos, buffer_.get() + bufferEnd_, pathLength) !=
      varint::VarintStatus::Ok) {
    return fail(ReadStatus::Corrupted);
  }

  const uint64_t prefixLength = pos - begin;
  const uint64_t afterPrefix = available - prefixLength;
  if (pathLength > afterPrefix || afterPrefix - pathLength < kRecordTailSize) {
    return fail(ReadStatus::Corrupted);
  }

  const uint64_t recordLength = prefixLength + pathLength + kRecordTailSize;
  if (!ensureBuffered(recordLength)) {
    return fail(ReadStatus::Corrupted);
  }

  // ensureBuffered may have moved the data.
  pos = buffer_.get() + bufferPos_ + prefixLength;
  path = std::string_view{pos, pathLength};
  pos += pathLength;
  value_ = encoding::readFloat64(pos);
  timestamp_ = encoding::readUint32(pos);
  days_ = daysFromTimestamp(timestamp_);

  bufferPos_ += recordLength;
  recordEnd_ += recordLength;
  return ReadStatus::Ok;
}

void RowBinaryReader::close() {
  file_.reset();
  buffer_.reset();
  bufferCapacity_ = 0;
  bufferPos_ = 0;
  bufferEnd_ = 0;
  status_ = ReadStatus::EndOfFile;
}

} // namespace tagrow::rowbinary
