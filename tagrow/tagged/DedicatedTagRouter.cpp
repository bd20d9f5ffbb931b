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
#include "tagrow/tagged/DedicatedTagRouter.h"

namespace tagrow::tagged {

DedicatedTagRouter::DedicatedTagRouter(
    const std::vector<DedicatedTag>& dedicatedTags) {
  columns_.reserve(dedicatedTags.size());
  tagToColumn_.reserve(dedicatedTags.size());
  for (const auto& dedicated : dedicatedTags) {
    tagToColumn_.insert_or_assign(dedicated.tag, columns_.size());
    columns_.push_back(dedicated.column);
  }
}

std::optional<DedicatedTagRouter::Route> DedicatedTagRouter::classify(
    std::string_view tagName) const {
  auto it = tagToColumn_.find(tagName);
  if (it == tagToColumn_.end()) {
    return std::nullopt;
  }
  return Route{columns_[it->second], it->second};
}

} // namespace tagrow::tagged
