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

#include <string>
#include <utility>
#include <vector>

#include "tagrow/tagged/TagParser.h"

using namespace ::tagrow::tagged;

namespace {

using Tags = std::vector<std::pair<std::string, std::string>>;

Tags tagsOf(const ParsedMetric& metric) {
  Tags tags;
  for (const auto& tag : metric.tags) {
    tags.emplace_back(tag.name, tag.value);
  }
  return tags;
}

ParsedMetric parseOk(std::string_view identifier) {
  ParsedMetric metric;
  EXPECT_EQ(parseTaggedMetric(identifier, metric), ParseStatus::Ok)
      << identifier;
  return metric;
}

} // namespace

TEST(TagParserTests, Simple) {
  auto metric = parseOk("cpu.load?host=a&dc=x");
  EXPECT_EQ(metric.path, "cpu.load");
  EXPECT_EQ(tagsOf(metric), (Tags{{"host", "a"}, {"dc", "x"}}));
}

TEST(TagParserTests, NotTagged) {
  ParsedMetric metric;
  metric.path = "stale";
  EXPECT_EQ(parseTaggedMetric("cpu.load", metric), ParseStatus::NotTagged);
  EXPECT_TRUE(metric.path.empty());
  EXPECT_TRUE(metric.tags.empty());
}

TEST(TagParserTests, EmptyQuery) {
  auto metric = parseOk("cpu.load?");
  EXPECT_EQ(metric.path, "cpu.load");
  EXPECT_TRUE(metric.tags.empty());

  metric = parseOk("?a=1");
  EXPECT_EQ(metric.path, "");
  EXPECT_EQ(tagsOf(metric), (Tags{{"a", "1"}}));
}

TEST(TagParserTests, SplitsOnFirstQuestionMark) {
  auto metric = parseOk("a?b=c?d");
  EXPECT_EQ(metric.path, "a");
  EXPECT_EQ(tagsOf(metric), (Tags{{"b", "c?d"}}));
}

TEST(TagParserTests, SplitsPairOnFirstEquals) {
  auto metric = parseOk("m?expr=a=b");
  EXPECT_EQ(tagsOf(metric), (Tags{{"expr", "a=b"}}));
}

TEST(TagParserTests, MissingEqualsGivesEmptyValue) {
  auto metric = parseOk("m?flag&x=1&=v");
  EXPECT_EQ(tagsOf(metric), (Tags{{"flag", ""}, {"x", "1"}, {"", "v"}}));
}

TEST(TagParserTests, EmptySegmentsSkipped) {
  auto metric = parseOk("m?&&a=1&&b=2&");
  EXPECT_EQ(tagsOf(metric), (Tags{{"a", "1"}, {"b", "2"}}));
}

TEST(TagParserTests, PlusHandling) {
  // '+' is literal in the path and a space in the query.
  auto metric = parseOk("a+b?k+1=v+2");
  EXPECT_EQ(metric.path, "a+b");
  EXPECT_EQ(tagsOf(metric), (Tags{{"k 1", "v 2"}}));
}

TEST(TagParserTests, PercentDecoding) {
  auto metric = parseOk("disk%2Fused?mount=%2Fvar%2Flog&name%3D=x%26y");
  EXPECT_EQ(metric.path, "disk/used");
  EXPECT_EQ(tagsOf(metric), (Tags{{"mount", "/var/log"}, {"name=", "x&y"}}));
  EXPECT_EQ(parseOk("m?a=%2b").tags.at(0).value, "+");
}

TEST(TagParserTests, MalformedPath) {
  ParsedMetric metric;
  EXPECT_EQ(
      parseTaggedMetric("bad%zz?a=1", metric), ParseStatus::MalformedPath);
  EXPECT_TRUE(metric.path.empty());
  EXPECT_EQ(
      parseTaggedMetric("bad%2?a=1", metric), ParseStatus::MalformedPath);
  EXPECT_EQ(parseTaggedMetric("bad%?a=1", metric), ParseStatus::MalformedPath);
}

TEST(TagParserTests, MalformedPairIsDropped) {
  auto metric = parseOk("m?a=%zz&b=2&%q=3");
  EXPECT_EQ(tagsOf(metric), (Tags{{"b", "2"}}));
}

TEST(TagParserTests, SemicolonPairIsDropped) {
  auto metric = parseOk("m?a=1;x=2&b=3&c;=4");
  EXPECT_EQ(tagsOf(metric), (Tags{{"b", "3"}}));

  // The path may hold a ';'.
  metric = parseOk("m;1?b=3");
  EXPECT_EQ(metric.path, "m;1");
}

TEST(TagParserTests, FirstValueWins) {
  auto metric = parseOk("m?env=prod&host=a&env=staging");
  EXPECT_EQ(tagsOf(metric), (Tags{{"env", "prod"}, {"host", "a"}}));

  // A dropped pair doesn't claim the name.
  metric = parseOk("m?env=%zz&env=staging");
  EXPECT_EQ(tagsOf(metric), (Tags{{"env", "staging"}}));
}

TEST(TagParserTests, ControlCharacters) {
  ParsedMetric metric;
  EXPECT_EQ(
      parseTaggedMetric(std::string_view("m?a=1\n", 6), metric),
      ParseStatus::InvalidControlCharacter);
  EXPECT_EQ(
      parseTaggedMetric(std::string_view("m?a=\x7f", 5), metric),
      ParseStatus::InvalidControlCharacter);
  EXPECT_EQ(
      parseTaggedMetric(std::string_view("m?a=\0", 5), metric),
      ParseStatus::InvalidControlCharacter);

  // Only the part after the '?' is checked.
  metric = parseOk(std::string_view("m\tx?a=1", 7));
  EXPECT_EQ(metric.path, "m\tx");

  // Escaped control characters are fine.
  metric = parseOk("m?a=%0A");
  EXPECT_EQ(metric.tags.at(0).value, "\n");

  // Bytes above 0x7f are not control characters.
  metric = parseOk("m?a=\xc3\xa9");
  EXPECT_EQ(metric.tags.at(0).value, "\xc3\xa9");
}

TEST(TagParserTests, Fragment) {
  auto metric = parseOk("m?a=1&b=2#frag");
  EXPECT_EQ(tagsOf(metric), (Tags{{"a", "1"}, {"b", "2"}}));

  metric = parseOk("m?#a=1");
  EXPECT_TRUE(metric.tags.empty());

  ParsedMetric bad;
  EXPECT_EQ(
      parseTaggedMetric("m?a=1#%zz", bad), ParseStatus::MalformedFragment);
  EXPECT_TRUE(bad.path.empty());
}

TEST(TagParserTests, ControlCharactersInFragment) {
  auto metric = parseOk("a?b=c#\x01");
  EXPECT_EQ(metric.path, "a");
  EXPECT_EQ(tagsOf(metric), (Tags{{"b", "c"}}));

  metric = parseOk("a?b=c&d=e#x\ty\x7f");
  EXPECT_EQ(tagsOf(metric), (Tags{{"b", "c"}, {"d", "e"}}));

  ParsedMetric bad;
  EXPECT_EQ(
      parseTaggedMetric("a?b=\x01" "c#frag", bad),
      ParseStatus::InvalidControlCharacter);
}

TEST(TagParserTests, ReusesOutput) {
  ParsedMetric metric;
  ASSERT_EQ(parseTaggedMetric("a?x=1&y=2", metric), ParseStatus::Ok);
  ASSERT_EQ(parseTaggedMetric("b?z=3", metric), ParseStatus::Ok);
  EXPECT_EQ(metric.path, "b");
  EXPECT_EQ(tagsOf(metric), (Tags{{"z", "3"}}));
}

TEST(TagParserTests, Find) {
  auto metric = parseOk("m?a=1&b=");
  ASSERT_NE(metric.find("a"), nullptr);
  EXPECT_EQ(*metric.find("a"), "1");
  ASSERT_NE(metric.find("b"), nullptr);
  EXPECT_EQ(*metric.find("b"), "");
  EXPECT_EQ(metric.find("c"), nullptr);
}

TEST(TagParserTests, StatusToString) {
  EXPECT_EQ(toString(ParseStatus::Ok), "Ok");
  EXPECT_EQ(toString(ParseStatus::NotTagged), "NotTagged");
  EXPECT_EQ(toString(ParseStatus::MalformedPath), "MalformedPath");
  EXPECT_EQ(toString(ParseStatus::MalformedFragment), "MalformedFragment");
  EXPECT_EQ(
      toString(ParseStatus::InvalidControlCharacter),
      "InvalidControlCharacter");
}
