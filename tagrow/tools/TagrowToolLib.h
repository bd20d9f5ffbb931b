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

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "tagrow/config/TaggedConfig.h"

namespace tagrow::tools {

class TagrowToolLib {
 public:
  explicit TagrowToolLib(std::ostream& ostream) : ostream_{ostream} {}

  // Converts every input record file into "<outputDir>/<name>.rowbinary",
  // sharing one existence cache, so a metric present in several inputs is
  // only written for the first one. Prints the insert query and a line per
  // file.
  void emitConvert(
      const std::vector<std::string>& inputs,
      const std::string& outputDir,
      const TaggedConfig& config,
      bool noHeader);

  // Prints the rows of a converted file.
  void emitRows(
      const std::string& file,
      size_t dedicatedColumnCount,
      bool noHeader,
      std::optional<uint64_t> limit);

  // Prints the records of an input file.
  void emitRecords(
      const std::string& file,
      bool noHeader,
      std::optional<uint64_t> limit);

 private:
  std::ostream& ostream_;
};

} // namespace tagrow::tools
