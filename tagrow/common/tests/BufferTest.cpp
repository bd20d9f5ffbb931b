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

#include <string>

#include "tagrow/common/Buffer.h"

namespace tagrow::test {

TEST(BufferTest, StartsEmpty) {
  WriteBuffer buffer;
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.size(), 0);
  EXPECT_GE(buffer.capacity(), 1024);
  EXPECT_TRUE(buffer.bytes().empty());
}

TEST(BufferTest, FixedWidthLittleEndian) {
  WriteBuffer buffer;
  buffer.writeUint16(0x0102);
  buffer.writeUint32(0x03040506);
  ASSERT_EQ(buffer.size(), 6);
  EXPECT_EQ(buffer.bytes(), std::string_view("\x02\x01\x06\x05\x04\x03", 6));
}

TEST(BufferTest, StringIsLengthPrefixed) {
  WriteBuffer buffer;
  buffer.writeString("abc");
  buffer.writeString("");
  EXPECT_EQ(buffer.bytes(), std::string_view("\x03" "abc" "\x00", 5));
}

TEST(BufferTest, LongStringPrefix) {
  WriteBuffer buffer;
  const std::string value(200, 'x');
  buffer.writeString(value);
  ASSERT_EQ(buffer.size(), 202);
  // 200 = 0b1'1001000: low 7 bits with continuation, then 1.
  EXPECT_EQ(static_cast<uint8_t>(buffer.data()[0]), 0xc8);
  EXPECT_EQ(static_cast<uint8_t>(buffer.data()[1]), 0x01);
  EXPECT_EQ(buffer.bytes().substr(2), value);
}

TEST(BufferTest, RawWriteHasNoPrefix) {
  WriteBuffer buffer;
  buffer.write("abc");
  buffer.write("");
  EXPECT_EQ(buffer.bytes(), "abc");
}

TEST(BufferTest, GrowsAndKeepsContent) {
  WriteBuffer buffer{/* initialCapacity */ 4};
  std::string expected;
  for (int i = 0; i < 1000; ++i) {
    const auto piece = std::to_string(i);
    buffer.write(piece);
    expected += piece;
  }
  EXPECT_EQ(buffer.bytes(), expected);
  EXPECT_GE(buffer.capacity(), expected.size());
}

TEST(BufferTest, ResetKeepsCapacity) {
  WriteBuffer buffer{/* initialCapacity */ 16};
  buffer.write(std::string(100, 'a'));
  const auto capacity = buffer.capacity();
  buffer.reset();
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.capacity(), capacity);
  buffer.writeUVarint(300);
  EXPECT_EQ(buffer.bytes(), std::string_view("\xac\x02", 2));
}

} // namespace tagrow::test
