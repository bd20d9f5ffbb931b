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
#include <folly/cli/NestedCommandLineApp.h>
#include <glog/logging.h>

#include <iostream>
#include <optional>

#include "tagrow/config/TaggedConfig.h"
#include "tagrow/tools/TagrowToolLib.h"

using namespace tagrow;
namespace po = ::boost::program_options;

template <typename T>
std::optional<T> getOptional(const po::variable_value& val) {
  return val.empty() ? std::nullopt : std::optional<T>(val.as<T>());
}

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  folly::NestedCommandLineApp app{"", "tagrow 1.0"};
  int style = po::command_line_style::default_style;
  style &= ~po::command_line_style::allow_guessing;
  app.setOptionStyle(static_cast<po::command_line_style::style_t>(style));

  po::positional_options_description inputArgs;
  inputArgs.add("inputs", /*max_count*/ -1);

  app.addCommand(
         "convert",
         "<input>...",
         "Convert record files into tagged rows",
         "Writes the tagged table rows of each input record file to "
         "<output_dir>/<input name>.rowbinary and prints the insert query.",
         [](const po::variables_map& options,
            const std::vector<std::string>& /*args*/) {
           // Command line options take precedence over the flag defaults.
           FLAGS_tagrow_table_name = options["table"].as<std::string>();
           FLAGS_tagrow_dedicated_tags =
               options["dedicated_tags"].as<std::string>();
           FLAGS_tagrow_ignored_tagged_metrics =
               options["ignored_tagged_metrics"].as<std::string>();
           tools::TagrowToolLib{std::cout}.emitConvert(
               options["inputs"].as<std::vector<std::string>>(),
               options["output_dir"].as<std::string>(),
               TaggedConfig::fromFlags(),
               options["no_header"].as<bool>());
         },
         inputArgs)
      // clang-format off
        .add_options()
            (
                "inputs",
                po::value<std::vector<std::string>>()->required(),
                "Record files to convert."
            )(
                "output_dir,o",
                po::value<std::string>()->required(),
                "Directory the converted files are written to."
            )(
                "table,t",
                po::value<std::string>()->default_value(
                    FLAGS_tagrow_table_name),
                "Table the rows are meant for."
            )(
                "dedicated_tags,d",
                po::value<std::string>()->default_value(
                    FLAGS_tagrow_dedicated_tags),
                "Tags stored in their own column: <tag>=<Column>,..."
            )(
                "ignored_tagged_metrics,i",
                po::value<std::string>()->default_value(
                    FLAGS_tagrow_ignored_tagged_metrics),
                "Base paths that only get a __name__ row. '*' for all."
            )(
                "no_header,n",
                po::bool_switch()->default_value(false),
                "Don't print column names. Default is to include column names."
            );
  // clang-format on

  po::positional_options_description fileArg;
  fileArg.add("file", /*max_count*/ 1);

  app.addCommand(
         "dump",
         "<file>",
         "Print converted rows",
         "Prints the rows of a file written by the convert command.",
         [](const po::variables_map& options,
            const std::vector<std::string>& /*args*/) {
           tools::TagrowToolLib{std::cout}.emitRows(
               options["file"].as<std::string>(),
               TaggedConfig::parseDedicatedTags(
                   options["dedicated_tags"].as<std::string>())
                   .size(),
               options["no_header"].as<bool>(),
               getOptional<uint64_t>(options["limit"]));
         },
         fileArg)
      // clang-format off
        .add_options()
            (
                "file",
                po::value<std::string>()->required(),
                "Converted file path."
            )(
                "dedicated_tags,d",
                po::value<std::string>()->default_value(
                    FLAGS_tagrow_dedicated_tags),
                "Dedicated tags the file was converted with: <tag>=<Column>,..."
            )(
                "limit,l",
                po::value<uint64_t>(),
                "Print at most this many rows. Default is to print all rows."
            )(
                "no_header,n",
                po::bool_switch()->default_value(false),
                "Don't print column names. Default is to include column names."
            );
  // clang-format on

  app.addCommand(
         "records",
         "<file>",
         "Print input records",
         "Prints the records of an input record file, up to the first "
         "corrupted record.",
         [](const po::variables_map& options,
            const std::vector<std::string>& /*args*/) {
           tools::TagrowToolLib{std::cout}.emitRecords(
               options["file"].as<std::string>(),
               options["no_header"].as<bool>(),
               getOptional<uint64_t>(options["limit"]));
         },
         fileArg)
      // clang-format off
        .add_options()
            (
                "file",
                po::value<std::string>()->required(),
                "Record file path."
            )(
                "limit,l",
                po::value<uint64_t>(),
                "Print at most this many records. Default is to print all."
            )(
                "no_header,n",
                po::bool_switch()->default_value(false),
                "Don't print column names. Default is to include column names."
            );
  // clang-format on

  app.addAlias("c", "convert");
  app.addAlias("d", "dump");
  app.addAlias("r", "records");

  return app.run(argc, argv);
}
