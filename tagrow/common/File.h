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

#include <folly/File.h>

#include <cstdint>
#include <string>
#include <string_view>

// Minimal file abstractions: record files are read through ReadFile, produced
// blobs are written through WriteFile. Local implementations report failures
// as TagrowExternalError with the FILE_SYSTEM source.

namespace tagrow {

class ReadFile {
 public:
  virtual ~ReadFile() = default;

  // Reads up to |length| bytes at |offset| into |buf|. Returns the number of
  // bytes read, which is only short at the end of the file.
  virtual uint64_t pread(uint64_t offset, uint64_t length, char* buf) const = 0;

  virtual uint64_t size() const = 0;

  virtual std::string name() const = 0;
};

class WriteFile {
 public:
  virtual ~WriteFile() = default;

  // Appends |data| to the end of the file. Either all bytes are accepted or
  // an exception is thrown.
  virtual void append(std::string_view data) = 0;

  virtual void flush() = 0;

  // Flushes and closes. No appends are allowed afterwards.
  virtual void close() = 0;

  // Bytes appended so far.
  virtual uint64_t size() const = 0;
};

class LocalReadFile final : public ReadFile {
 public:
  explicit LocalReadFile(std::string path);

  uint64_t pread(uint64_t offset, uint64_t length, char* buf) const override;

  uint64_t size() const override {
    return size_;
  }

  std::string name() const override {
    return path_;
  }

 private:
  const std::string path_;
  folly::File file_;
  uint64_t size_;
};

class InMemoryReadFile final : public ReadFile {
 public:
  // |data| must outlive *this.
  explicit InMemoryReadFile(std::string_view data) : data_{data} {}

  uint64_t pread(uint64_t offset, uint64_t length, char* buf) const override;

  uint64_t size() const override {
    return data_.size();
  }

  std::string name() const override {
    return "<memory>";
  }

 private:
  const std::string_view data_;
};

class LocalWriteFile final : public WriteFile {
 public:
  // Creates (or truncates) the file at |path|.
  explicit LocalWriteFile(std::string path);

  ~LocalWriteFile() override;

  void append(std::string_view data) override;
  void flush() override;
  void close() override;

  uint64_t size() const override {
    return size_;
  }

 private:
  const std::string path_;
  folly::File file_;
  uint64_t size_{0};
  bool closed_{false};
};

// Appends into a caller owned string.
class StringWriteFile final : public WriteFile {
 public:
  explicit StringWriteFile(std::string* out) : out_{out} {}

  void append(std::string_view data) override;

  void flush() override {}

  void close() override {
    closed_ = true;
  }

  uint64_t size() const override {
    return out_->size();
  }

 private:
  std::string* const out_;
  bool closed_{false};
};

} // namespace tagrow
