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

#include <folly/container/F14Set.h>

#include <string>
#include <string_view>

namespace tagrow {

// Set of "<day>:<identifier>" keys.
using KeySet = folly::F14FastSet<std::string>;

// Read side of the cross-run record of metrics already loaded into the
// store. Implementations must allow concurrent exists() calls.
class ExistenceCache {
 public:
  virtual ~ExistenceCache() = default;

  virtual bool exists(std::string_view key) const = 0;
};

} // namespace tagrow
