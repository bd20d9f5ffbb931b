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
#include "tagrow/common/File.h"

#include <fcntl.h>
#include <sys/stat.h>

#include <folly/FileUtil.h>
#include <folly/String.h>
#include <glog/logging.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "tagrow/common/Exceptions.h"

namespace tagrow {

namespace {
folly::File openFile(const std::string& path, int flags) {
  try {
    return folly::File{path, flags, 0644};
  } catch (const std::system_error& e) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to open {}: {}",
        path,
        e.what());
  }
}
} // namespace

LocalReadFile::LocalReadFile(std::string path)
    : path_{std::move(path)}, file_{openFile(path_, O_RDONLY)} {
  struct stat st;
  if (::fstat(file_.fd(), &st) != 0) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to stat {}: {}",
        path_,
        folly::errnoStr(errno));
  }
  size_ = st.st_size;
}

uint64_t LocalReadFile::pread(uint64_t offset, uint64_t length, char* buf)
    const {
  const auto bytesRead = folly::preadFull(file_.fd(), buf, length, offset);
  if (bytesRead < 0) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to read {} bytes at offset {} from {}: {}",
        length,
        offset,
        path_,
        folly::errnoStr(errno));
  }
  return static_cast<uint64_t>(bytesRead);
}

uint64_t InMemoryReadFile::pread(uint64_t offset, uint64_t length, char* buf)
    const {
  if (offset >= data_.size()) {
    return 0;
  }
  const auto bytesRead = std::min<uint64_t>(length, data_.size() - offset);
  std::memcpy(buf, data_.data() + offset, bytesRead);
  return bytesRead;
}

LocalWriteFile::LocalWriteFile(std::string path)
    : path_{std::move(path)},
      file_{openFile(path_, O_WRONLY | O_CREAT | O_TRUNC)} {}

LocalWriteFile::~LocalWriteFile() {
  if (!closed_ && !file_.closeNoThrow()) {
    LOG(WARNING) << "Failed to close " << path_ << ": "
                 << folly::errnoStr(errno);
  }
}

void LocalWriteFile::append(std::string_view data) {
  TAGROW_CHECK(!closed_, "Append to closed file {}", path_);
  const auto written = folly::writeFull(file_.fd(), data.data(), data.size());
  if (written < 0 || static_cast<uint64_t>(written) != data.size()) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to write {} bytes to {}: {}",
        data.size(),
        path_,
        folly::errnoStr(errno));
  }
  size_ += data.size();
}

void LocalWriteFile::flush() {
  TAGROW_CHECK(!closed_, "Flush of closed file {}", path_);
  if (folly::fsyncNoInt(file_.fd()) != 0) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to sync {}: {}",
        path_,
        folly::errnoStr(errno));
  }
}

void LocalWriteFile::close() {
  if (closed_) {
    return;
  }
  flush();
  closed_ = true;
  if (!file_.closeNoThrow()) {
    TAGROW_RAISE_EXTERNAL_ERROR(
        ::tagrow::external_source::LocalFileSystem,
        "Failed to close {}: {}",
        path_,
        folly::errnoStr(errno));
  }
}

void StringWriteFile::append(std::string_view data) {
  TAGROW_CHECK(!closed_, "Append to closed string file");
  out_->append(data.data(), data.size());
}

} // namespace tagrow
