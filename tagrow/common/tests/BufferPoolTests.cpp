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

#include <thread>
#include <vector>

#include "tagrow/common/BufferPool.h"
#include "tagrow/common/Exceptions.h"

namespace tagrow::test {

TEST(BufferPoolTest, CreateBufferPoolBadMaxPool) {
  try {
    auto bufferPool = BufferPool{/* maxPoolSize */ 0};
    FAIL();
  } catch (const TagrowUserError& e) {
    EXPECT_EQ(e.errorMessage(), "max pool size must be > 0");
  }
}

TEST(BufferPoolTest, ReserveBuffer) {
  auto bufferPool = BufferPool{/* maxPoolSize */ 10};
  EXPECT_EQ(bufferPool.size(), 10);
  {
    auto buffer = bufferPool.reserveBuffer();
    EXPECT_EQ(bufferPool.size(), 9);
  }
  EXPECT_EQ(bufferPool.size(), 10);
}

TEST(BufferPoolTest, EmptyFillBufferPool) {
  size_t iterations = 10;
  auto bufferPool = BufferPool{/* maxPoolSize */ iterations};

  for (size_t i = 0; i < iterations; ++i) {
    {
      auto buffer1 = bufferPool.reserveBuffer();
      auto buffer2 = bufferPool.reserveBuffer();
      auto buffer3 = bufferPool.reserveBuffer();

      EXPECT_EQ(bufferPool.size(), iterations - 3);
    }
    EXPECT_EQ(bufferPool.size(), iterations);
  }
}

TEST(BufferPoolTest, GrowsBeyondMaxAndTrimsOnReturn) {
  auto bufferPool = BufferPool{/* maxPoolSize */ 2};
  {
    auto buffer1 = bufferPool.reserveBuffer();
    auto buffer2 = bufferPool.reserveBuffer();
    EXPECT_EQ(bufferPool.size(), 0);
    // Empty pool: a new buffer is allocated instead of blocking.
    auto buffer3 = bufferPool.reserveBuffer();
    EXPECT_EQ(bufferPool.size(), 0);
  }
  EXPECT_EQ(bufferPool.size(), 2);
}

TEST(BufferPoolTest, ReturnedBufferIsReset) {
  auto bufferPool = BufferPool{/* maxPoolSize */ 1};
  {
    auto buffer = bufferPool.reserveBuffer();
    buffer->writeString("some content");
    EXPECT_FALSE(buffer->empty());
  }
  auto buffer = bufferPool.reserveBuffer();
  EXPECT_TRUE(buffer->empty());
  EXPECT_EQ(buffer->size(), 0);
}

TEST(BufferPoolTest, MovedLeaseReturnsOnce) {
  auto bufferPool = BufferPool{/* maxPoolSize */ 3};
  {
    auto buffer = bufferPool.reserveBuffer();
    auto moved = std::move(buffer);
    EXPECT_EQ(bufferPool.size(), 2);
    moved->writeUint32(7);
  }
  EXPECT_EQ(bufferPool.size(), 3);
}

TEST(BufferPoolTest, ParallelLeases) {
  auto bufferPool =
      BufferPool{/* maxPoolSize */ 4, /* initialBufferCapacity */ 1024};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&bufferPool, t]() {
      for (int i = 0; i < 1000; ++i) {
        auto buffer = bufferPool.reserveBuffer();
        buffer->writeUint32(t * 1000 + i);
        EXPECT_EQ(buffer->size(), sizeof(uint32_t));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(bufferPool.size(), 4);
}

} // namespace tagrow::test
