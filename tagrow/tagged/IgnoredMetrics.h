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
#include <vector>

namespace tagrow::tagged {

// Base paths that only get a __name__ index row. Their other generic tags
// are still stored in the tag array of that row.
class IgnoredMetrics {
 public:
  static constexpr std::string_view kWildcard = "*";

  explicit IgnoredMetrics(const std::vector<std::string>& paths);

  bool ignoreAllButName(std::string_view path) const {
    return wildcard_ || paths_.find(path) != paths_.end();
  }

  bool empty() const {
    return !wildcard_ && paths_.empty();
  }

 private:
  folly::F14FastSet<std::string> paths_;
  bool wildcard_{false};
};

} // namespace tagrow::tagged
