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

#include "tagrow/cache/ExistsCache.h"
#include "tagrow/tagged/DedupGate.h"

using namespace ::tagrow;
using namespace ::tagrow::tagged;

TEST(DedupGateTests, KeyFormat) {
  EXPECT_EQ(dedupKey(19358, "cpu?host=a"), "19358:cpu?host=a");
  EXPECT_EQ(dedupKey(0, ""), "0:");
  EXPECT_EQ(dedupKey(65535, "m?a=1"), "65535:m?a=1");
}

TEST(DedupGateTests, FirstOccurrencePerDay) {
  ExistsCache cache;
  DedupGate gate{cache};

  EXPECT_TRUE(gate.shouldProcess(10, "cpu?host=a"));
  EXPECT_FALSE(gate.shouldProcess(10, "cpu?host=a"));
  // Same identifier on another day is a different key.
  EXPECT_TRUE(gate.shouldProcess(11, "cpu?host=a"));
  EXPECT_TRUE(gate.shouldProcess(10, "cpu?host=b"));

  EXPECT_EQ(gate.seen().size(), 3);
  EXPECT_EQ(gate.seen().count("10:cpu?host=a"), 1);
  EXPECT_EQ(gate.seen().count("11:cpu?host=a"), 1);
  EXPECT_EQ(gate.seen().count("10:cpu?host=b"), 1);
}

TEST(DedupGateTests, SkipsCachedKeys) {
  ExistsCache cache;
  cache.merge({"10:cpu?host=a"}, 100);
  DedupGate gate{cache};

  EXPECT_FALSE(gate.shouldProcess(10, "cpu?host=a"));
  EXPECT_TRUE(gate.shouldProcess(11, "cpu?host=a"));
  // Cached keys are not recorded as seen.
  EXPECT_EQ(gate.seen().size(), 1);
  EXPECT_EQ(gate.seen().count("10:cpu?host=a"), 0);
}

TEST(DedupGateTests, DoesNotWriteToCache) {
  ExistsCache cache;
  DedupGate gate{cache};
  EXPECT_TRUE(gate.shouldProcess(1, "m?a=1"));
  EXPECT_EQ(cache.count(), 0);
  EXPECT_FALSE(cache.exists("1:m?a=1"));
}

TEST(DedupGateTests, Release) {
  ExistsCache cache;
  DedupGate gate{cache};
  EXPECT_TRUE(gate.shouldProcess(1, "m?a=1"));
  EXPECT_TRUE(gate.shouldProcess(1, "m?a=2"));

  auto released = gate.release();
  EXPECT_EQ(released.size(), 2);
  EXPECT_TRUE(gate.seen().empty());

  // Released keys are forgotten by the gate.
  EXPECT_TRUE(gate.shouldProcess(1, "m?a=1"));
}
