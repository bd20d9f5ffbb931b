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
#include <folly/FileUtil.h>
#include <folly/testing/TestUtil.h>
#include <gtest/gtest.h>

#include <string>

#include "tagrow/common/Exceptions.h"
#include "tagrow/common/File.h"
#include "tagrow/common/tests/TestUtils.h"

namespace tagrow::test {

TEST(FileTests, LocalWriteThenRead) {
  folly::test::TemporaryDirectory tmpDir;
  const auto path = (tmpDir.path() / "out.bin").string();

  {
    LocalWriteFile file{path};
    file.append("hello ");
    file.append("");
    file.append("world");
    EXPECT_EQ(file.size(), 11);
    file.close();
    // Closing twice is allowed.
    file.close();
  }

  std::string onDisk;
  ASSERT_TRUE(folly::readFile(path.c_str(), onDisk));
  EXPECT_EQ(onDisk, "hello world");

  LocalReadFile file{path};
  EXPECT_EQ(file.size(), 11);
  EXPECT_EQ(file.name(), path);

  char buf[16];
  EXPECT_EQ(file.pread(6, 5, buf), 5);
  EXPECT_EQ(std::string_view(buf, 5), "world");

  // Short read at the end of the file.
  EXPECT_EQ(file.pread(8, 16, buf), 3);
  EXPECT_EQ(std::string_view(buf, 3), "rld");
  EXPECT_EQ(file.pread(11, 4, buf), 0);
}

TEST(FileTests, LocalWriteTruncatesExisting) {
  folly::test::TemporaryDirectory tmpDir;
  const auto path = (tmpDir.path() / "out.bin").string();
  ASSERT_TRUE(folly::writeFile(std::string("previous content"), path.c_str()));

  LocalWriteFile file{path};
  file.append("new");
  file.close();

  LocalReadFile reader{path};
  EXPECT_EQ(reader.size(), 3);
}

TEST(FileTests, LocalAppendAfterClose) {
  folly::test::TemporaryDirectory tmpDir;
  LocalWriteFile file{(tmpDir.path() / "out.bin").string()};
  file.close();
  TAGROW_ASSERT_THROW(file.append("x"), "Append to closed file");
}

TEST(FileTests, MissingFile) {
  folly::test::TemporaryDirectory tmpDir;
  const auto path = (tmpDir.path() / "missing.bin").string();
  try {
    LocalReadFile file{path};
    FAIL() << "Expected an exception";
  } catch (const TagrowExternalError& e) {
    EXPECT_EQ(e.errorCode(), error_code::IoError.c_str());
    EXPECT_EQ(e.externalSource(), external_source::LocalFileSystem.c_str());
    EXPECT_TRUE(e.retryable());
    EXPECT_NE(e.errorMessage().find(path), std::string::npos);
  }
}

TEST(FileTests, InMemoryRead) {
  const std::string data = "0123456789";
  InMemoryReadFile file{data};
  EXPECT_EQ(file.size(), 10);
  EXPECT_EQ(file.name(), "<memory>");

  char buf[8];
  EXPECT_EQ(file.pread(2, 3, buf), 3);
  EXPECT_EQ(std::string_view(buf, 3), "234");
  EXPECT_EQ(file.pread(7, 8, buf), 3);
  EXPECT_EQ(std::string_view(buf, 3), "789");
  EXPECT_EQ(file.pread(10, 1, buf), 0);
  EXPECT_EQ(file.pread(100, 1, buf), 0);
}

TEST(FileTests, StringWrite) {
  std::string out;
  StringWriteFile file{&out};
  file.append("abc");
  file.append("def");
  file.flush();
  EXPECT_EQ(file.size(), 6);
  EXPECT_EQ(out, "abcdef");

  file.close();
  TAGROW_ASSERT_THROW(file.append("g"), "Append to closed string file");
  EXPECT_EQ(out, "abcdef");
}

} // namespace tagrow::test
