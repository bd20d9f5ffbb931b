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
#include "tagrow/tagged/TagParser.h"

#include <folly/Range.h>
#include <folly/String.h>

#include <algorithm>
#include <stdexcept>

#include "tagrow/common/Exceptions.h"

namespace tagrow::tagged {

namespace {

bool isControlCharacter(char c) {
  const auto b = static_cast<unsigned char>(c);
  return b < 0x20 || b == 0x7f;
}

// Appends the decoded form of |input| to |out|. Returns false on an invalid
// percent escape, in which case |out| holds partial output.
bool unescape(
    std::string_view input,
    std::string& out,
    folly::UriEscapeMode mode) {
  try {
    folly::uriUnescape(
        folly::StringPiece{input.data(), input.size()}, out, mode);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

void addTag(
    std::string_view pair,
    std::string& name,
    std::string& value,
    ParsedMetric& out) {
  if (pair.find(';') != std::string_view::npos) {
    return;
  }
  std::string_view rawName = pair;
  std::string_view rawValue;
  if (auto eq = pair.find('='); eq != std::string_view::npos) {
    rawName = pair.substr(0, eq);
    rawValue = pair.substr(eq + 1);
  }

  name.clear();
  value.clear();
  if (!unescape(rawName, name, folly::UriEscapeMode::QUERY) ||
      !unescape(rawValue, value, folly::UriEscapeMode::QUERY)) {
    return;
  }
  if (out.find(name) == nullptr) {
    out.tags.push_back(Tag{name, value});
  }
}

} // namespace

const std::string* ParsedMetric::find(std::string_view name) const {
  auto it = std::find_if(tags.begin(), tags.end(), [name](const Tag& tag) {
    return tag.name == name;
  });
  return it == tags.end() ? nullptr : &it->value;
}

std::string_view toString(ParseStatus status) {
  switch (status) {
    case ParseStatus::Ok:
      return "Ok";
    case ParseStatus::NotTagged:
      return "NotTagged";
    case ParseStatus::MalformedPath:
      return "MalformedPath";
    case ParseStatus::MalformedFragment:
      return "MalformedFragment";
    case ParseStatus::InvalidControlCharacter:
      return "InvalidControlCharacter";
  }
  TAGROW_UNREACHABLE("Unknown parse status: {}", static_cast<int>(status));
}

ParseStatus parseTaggedMetric(
    std::string_view identifier,
    ParsedMetric& out) {
  out.clear();

  const auto questionMark = identifier.find('?');
  if (questionMark == std::string_view::npos) {
    return ParseStatus::NotTagged;
  }

  std::string_view query = identifier.substr(questionMark + 1);
  const auto hash = query.find('#');
  // Control bytes are only rejected ahead of the fragment.
  const auto beforeFragment = query.substr(0, hash);
  if (std::any_of(
          beforeFragment.begin(), beforeFragment.end(), isControlCharacter)) {
    return ParseStatus::InvalidControlCharacter;
  }

  if (!unescape(
          identifier.substr(0, questionMark),
          out.path,
          folly::UriEscapeMode::PATH)) {
    out.path.clear();
    return ParseStatus::MalformedPath;
  }

  if (hash != std::string_view::npos) {
    std::string fragment;
    if (!unescape(
            query.substr(hash + 1), fragment, folly::UriEscapeMode::ALL)) {
      out.path.clear();
      return ParseStatus::MalformedFragment;
    }
    query = beforeFragment;
  }

  std::string name;
  std::string value;
  while (!query.empty()) {
    std::string_view pair = query;
    if (auto amp = query.find('&'); amp != std::string_view::npos) {
      pair = query.substr(0, amp);
      query = query.substr(amp + 1);
    } else {
      query = {};
    }
    if (!pair.empty()) {
      addTag(pair, name, value, out);
    }
  }
  return ParseStatus::Ok;
}

} // namespace tagrow::tagged
