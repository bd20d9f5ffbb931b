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
#include "tagrow/tagged/MalformedFilter.h"

#include <folly/String.h>
#include <glog/logging.h>

#include "tagrow/common/Exceptions.h"

namespace tagrow::tagged {

std::string_view toString(MalformedReason reason) {
  switch (reason) {
    case MalformedReason::None:
      return "None";
    case MalformedReason::TooLong:
      return "name too long, skipping";
    case MalformedReason::BadLeadingCharacter:
      return "name starts with wrong char, skipping";
  }
  TAGROW_UNREACHABLE("Unknown malformed reason: {}", static_cast<int>(reason));
}

bool acceptIdentifier(std::string_view identifier) {
  const auto reason = checkIdentifier(identifier);
  if (FOLLY_LIKELY(reason == MalformedReason::None)) {
    return true;
  }
  LOG(WARNING) << toString(reason) << ": \""
               << folly::cEscape<std::string>(folly::StringPiece{
                      identifier.data(), identifier.size()})
               << "\"";
  return false;
}

} // namespace tagrow::tagged
