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

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace tagrow::tagged {

// Columns every tagged row starts with, in row order.
inline constexpr std::array<std::string_view, 5> kBaseColumns{
    "Date",
    "Name",
    "Path",
    "Tags",
    "Version"};

// Table and column list the produced blob is inserted with, e.g.
// "graphite_tagged (Date, Name, Path, Tags, Version, Env)".
std::string insertQuery(
    std::string_view table,
    const std::vector<std::string>& dedicatedColumns);

} // namespace tagrow::tagged
