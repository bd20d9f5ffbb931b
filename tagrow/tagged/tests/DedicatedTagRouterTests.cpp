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

#include "tagrow/tagged/DedicatedTagRouter.h"

using namespace ::tagrow;
using namespace ::tagrow::tagged;

TEST(DedicatedTagRouterTests, Empty) {
  DedicatedTagRouter router{std::vector<DedicatedTag>{}};
  EXPECT_EQ(router.columnCount(), 0);
  EXPECT_FALSE(router.classify("env").has_value());
  EXPECT_FALSE(router.classify("").has_value());
}

TEST(DedicatedTagRouterTests, RoutesListedTags) {
  DedicatedTagRouter router{{{"env", "Env"}, {"dc", "Datacenter"}}};
  ASSERT_EQ(router.columnCount(), 2);
  EXPECT_EQ(
      router.columnNames(), (std::vector<std::string>{"Env", "Datacenter"}));

  auto env = router.classify("env");
  ASSERT_TRUE(env.has_value());
  EXPECT_EQ(env->column, "Env");
  EXPECT_EQ(env->index, 0);

  auto dc = router.classify("dc");
  ASSERT_TRUE(dc.has_value());
  EXPECT_EQ(dc->column, "Datacenter");
  EXPECT_EQ(dc->index, 1);

  EXPECT_FALSE(router.classify("host").has_value());
  // Matching is exact.
  EXPECT_FALSE(router.classify("Env").has_value());
  EXPECT_FALSE(router.classify("env ").has_value());
}

TEST(DedicatedTagRouterTests, RepeatedTagLastWins) {
  DedicatedTagRouter router{{{"env", "EnvA"}, {"env", "EnvB"}}};
  EXPECT_EQ(router.columnCount(), 2);
  auto route = router.classify("env");
  ASSERT_TRUE(route.has_value());
  EXPECT_EQ(route->column, "EnvB");
  EXPECT_EQ(route->index, 1);
}
