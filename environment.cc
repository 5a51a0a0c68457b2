// Copyright 2024 The Diffcov Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "./environment.h"

#include <cstddef>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "./colormap.h"
#include "./output.h"
#include "./reducer.h"

ABSL_FLAG(std::string, include_approach, "",
          "A comma-separated list of regular expressions. If not empty, only "
          "approaches whose name contains a match of one of them are "
          "analyzed. Applied before --exclude_approach.");
ABSL_FLAG(std::string, exclude_approach, "",
          "A comma-separated list of regular expressions. Approaches whose "
          "name contains a match of one of them are left out of the "
          "analysis. Excluding an approach changes the relscore of the "
          "others, since it no longer counts as missing any edge.");
ABSL_FLAG(std::string, output, "stdout",
          "Output format: stdout (plain text), csv or latex.");
ABSL_FLAG(std::string, latex_rotate_headers, "",
          "If not empty, rotate the column headers of LaTeX tables by this "
          "many degrees (e.g. 45). The emitted table needs the adjustbox and "
          "array packages.");
ABSL_FLAG(bool, latex_enable_color, false,
          "With --output=latex, color the background of numeric cells by "
          "value. Needs \\usepackage[table]{xcolor}.");
ABSL_FLAG(std::string, latex_colormap, "viridis",
          "Colormap for --latex_enable_color: viridis, plasma, magma, "
          "inferno or cividis.");
ABSL_FLAG(std::string, value_reducer, "median",
          "How relcov commands combine per-trial values: median, min, max or "
          "mean.");
ABSL_FLAG(std::string, collection_reducer, "union",
          "How relcov commands combine the trials of a reference approach "
          "into one edge set: union or intersection.");
ABSL_FLAG(std::string, reference, "",
          "For relcov-performance-fuzzer: the approach to compare against. "
          "For relcov-performance-corpus: the single-trial approach that "
          "holds the input corpus. If empty, these commands print a table "
          "over all candidates.");
ABSL_FLAG(size_t, num_threads, 1,
          "Number of threads computing the rows of relcov tables.");
ABSL_FLAG(size_t, log_level, 1,
          "Logging level. 0: errors only. 1: campaign summary and progress. "
          "2 and above: per-approach details.");

namespace diffcov {

namespace {

constexpr Command kAllCommands[] = {
    Command::kRelscore,
    Command::kRelcov,
    Command::kRelcovReliability,
    Command::kRelcovPerformanceFuzzer,
    Command::kRelcovPerformanceCorpus,
};

std::vector<std::string> SplitPatterns(const std::string &flag_value) {
  return absl::StrSplit(flag_value, ',', absl::SkipEmpty{});
}

}  // namespace

absl::string_view CommandName(Command command) {
  switch (command) {
    case Command::kRelscore:
      return "relscore";
    case Command::kRelcov:
      return "relcov";
    case Command::kRelcovReliability:
      return "relcov-reliability";
    case Command::kRelcovPerformanceFuzzer:
      return "relcov-performance-fuzzer";
    case Command::kRelcovPerformanceCorpus:
      return "relcov-performance-corpus";
  }
  return "unknown";
}

bool ParseCommand(absl::string_view name, Command &command) {
  for (Command candidate : kAllCommands) {
    if (name == CommandName(candidate)) {
      command = candidate;
      return true;
    }
  }
  return false;
}

Environment::Environment(const std::vector<std::string> &argv)
    : include_approach(SplitPatterns(absl::GetFlag(FLAGS_include_approach))),
      exclude_approach(SplitPatterns(absl::GetFlag(FLAGS_exclude_approach))),
      output(absl::GetFlag(FLAGS_output)),
      latex_rotate_headers(absl::GetFlag(FLAGS_latex_rotate_headers)),
      latex_enable_color(absl::GetFlag(FLAGS_latex_enable_color)),
      latex_colormap(absl::GetFlag(FLAGS_latex_colormap)),
      value_reducer(absl::GetFlag(FLAGS_value_reducer)),
      collection_reducer(absl::GetFlag(FLAGS_collection_reducer)),
      reference(absl::GetFlag(FLAGS_reference)),
      num_threads(absl::GetFlag(FLAGS_num_threads)),
      log_level(absl::GetFlag(FLAGS_log_level)) {
  if (!argv.empty()) {
    exec_name = argv[0];
    args.assign(argv.begin() + 1, argv.end());
  }
}

absl::StatusOr<RunConfig> Environment::Resolve() const {
  RunConfig config;
  if (args.size() != 2) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expected <command> <campaign_dir>, got ", args.size(),
        " positional argument(s)"));
  }
  if (!ParseCommand(args[0], config.command)) {
    std::vector<std::string> names;
    for (Command command : kAllCommands) {
      names.emplace_back(CommandName(command));
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown command '", args[0], "'; expected one of ",
                     absl::StrJoin(names, ", ")));
  }
  config.campaign_dir = args[1];

  if (!ParseOutputFormat(output, config.output.format)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Unknown --output '", output, "'; expected stdout, csv or latex"));
  }
  if (!latex_rotate_headers.empty()) {
    double degrees = 0;
    if (!absl::SimpleAtod(latex_rotate_headers, &degrees)) {
      return absl::InvalidArgumentError(
          absl::StrCat("--latex_rotate_headers is not a number: '",
                       latex_rotate_headers, "'"));
    }
    config.output.latex_rotate_headers = degrees;
  }
  config.output.latex_enable_color = latex_enable_color;
  if (!IsKnownColormap(latex_colormap)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown --latex_colormap '", latex_colormap,
                     "'; expected one of ", absl::StrJoin(ColormapNames(), ", ")));
  }
  config.output.latex_colormap = latex_colormap;

  if (!ParseValueReducer(value_reducer, config.value_reducer)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown --value_reducer '", value_reducer,
                     "'; expected median, min, max or mean"));
  }
  if (!ParseCollectionReducer(collection_reducer, config.collection_reducer)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown --collection_reducer '", collection_reducer,
                     "'; expected union or intersection"));
  }
  return config;
}

}  // namespace diffcov
