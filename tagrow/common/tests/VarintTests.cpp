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
#include <folly/Random.h>
#include <folly/Varint.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include <cstring>
#include <limits>
#include <random>
#include <vector>

#include "tagrow/common/Varint.h"

using namespace ::tagrow;

namespace {
const int kNumElements = 10000;
}

TEST(VarintTests, MatchesFollyEncoding) {
  auto seed = folly::Random::rand32();
  LOG(INFO) << "seed: " << seed;
  std::mt19937 rng(seed);

  std::vector<uint64_t> data;
  // Generate data with uniform bit length.
  for (int i = 0; i < kNumElements; ++i) {
    const int bitShift = folly::Random::rand32(rng) % 64;
    data.push_back(folly::Random::rand64(rng) >> bitShift);
  }

  auto buffer =
      std::make_unique<char[]>(kNumElements * varint::kMaxVarintLength64);
  char* pos = buffer.get();
  uint64_t expectedSize = 0;
  for (int i = 0; i < kNumElements; ++i) {
    varint::writeVarint(data[i], &pos);
    expectedSize += varint::varintSize(data[i]);
  }
  ASSERT_EQ(pos - buffer.get(), expectedSize);

  auto follyBuffer =
      std::make_unique<uint8_t[]>(kNumElements * folly::kMaxVarintLength64);
  uint8_t* fpos = follyBuffer.get();
  for (int i = 0; i < kNumElements; ++i) {
    fpos += folly::encodeVarint(data[i], fpos);
  }
  ASSERT_EQ(pos - buffer.get(), fpos - follyBuffer.get());
  ASSERT_EQ(0, memcmp(buffer.get(), follyBuffer.get(), expectedSize));

  const char* cpos = buffer.get();
  const char* end = pos;
  for (int i = 0; i < kNumElements; ++i) {
    uint64_t value;
    ASSERT_EQ(
        varint::tryReadVarint64(&cpos, end, value), varint::VarintStatus::Ok);
    ASSERT_EQ(value, data[i]);
  }
  ASSERT_EQ(cpos, end);
}

TEST(VarintTests, Truncated) {
  const char data[] = {'\x80', '\x80'};
  const char* pos = data;
  uint64_t value = 17;
  EXPECT_EQ(
      varint::tryReadVarint64(&pos, data + sizeof(data), value),
      varint::VarintStatus::Truncated);
  EXPECT_EQ(pos, data);
  EXPECT_EQ(value, 17);

  EXPECT_EQ(
      varint::tryReadVarint64(&pos, data, value),
      varint::VarintStatus::Truncated);
}

TEST(VarintTests, Overflow) {
  // Eleven continuation bytes.
  std::vector<char> tooLong(11, '\xff');
  const char* pos = tooLong.data();
  uint64_t value;
  EXPECT_EQ(
      varint::tryReadVarint64(&pos, tooLong.data() + tooLong.size(), value),
      varint::VarintStatus::Overflow);

  // Ten bytes, but the last one sets bits past the 64th.
  std::vector<char> tooWide(9, '\xff');
  tooWide.push_back('\x02');
  pos = tooWide.data();
  EXPECT_EQ(
      varint::tryReadVarint64(&pos, tooWide.data() + tooWide.size(), value),
      varint::VarintStatus::Overflow);
}

TEST(VarintTests, MaxValue) {
  char buffer[varint::kMaxVarintLength64];
  char* pos = buffer;
  varint::writeVarint(std::numeric_limits<uint64_t>::max(), &pos);
  ASSERT_EQ(pos - buffer, varint::kMaxVarintLength64);

  const char* cpos = buffer;
  uint64_t value;
  ASSERT_EQ(
      varint::tryReadVarint64(&cpos, pos, value), varint::VarintStatus::Ok);
  EXPECT_EQ(value, std::numeric_limits<uint64_t>::max());

  cpos = buffer;
  EXPECT_EQ(varint::readVarint64(&cpos), std::numeric_limits<uint64_t>::max());
}
