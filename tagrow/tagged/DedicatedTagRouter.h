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

#include <folly/container/F14Map.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tagrow/config/TaggedConfig.h"

namespace tagrow::tagged {

// Decides which tags go to a dedicated column rather than into the generic
// tag array.
class DedicatedTagRouter {
 public:
  struct Route {
    std::string_view column;
    // Position of the column among the dedicated columns.
    size_t index;
  };

  // If a tag name is listed twice, the last entry decides its column. Every
  // entry still contributes a column.
  explicit DedicatedTagRouter(const std::vector<DedicatedTag>& dedicatedTags);

  // Returns the column |tagName| is routed to, or std::nullopt for a generic
  // tag.
  std::optional<Route> classify(std::string_view tagName) const;

  const std::vector<std::string>& columnNames() const {
    return columns_;
  }

  size_t columnCount() const {
    return columns_.size();
  }

 private:
  std::vector<std::string> columns_;
  folly::F14FastMap<std::string, size_t> tagToColumn_;
};

} // namespace tagrow::tagged
