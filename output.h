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

// Renders scores and result tables as plain text, CSV or LaTeX.

#ifndef THIRD_PARTY_DIFFCOV_OUTPUT_H_
#define THIRD_PARTY_DIFFCOV_OUTPUT_H_

#include <optional>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "./result_table.h"

namespace diffcov {

enum class OutputFormat { kStdout, kCsv, kLatex };

// "stdout", "csv", "latex".
absl::string_view OutputFormatName(OutputFormat format);
bool ParseOutputFormat(absl::string_view name, OutputFormat &format);

struct OutputOptions {
  OutputFormat format = OutputFormat::kStdout;
  // LaTeX only: rotate the column headers of tables by this many degrees.
  std::optional<double> latex_rotate_headers;
  // LaTeX only: color the background of numeric cells by value.
  bool latex_enable_color = false;
  std::string latex_colormap = "viridis";
};

// Escapes the LaTeX special characters of `text`.
std::string LatexEscape(absl::string_view text);

// Prints one line per approach, highest score first. Undefined scores come
// last. Returns InvalidArgument if colored LaTeX output was requested with an
// unknown colormap; nothing is printed in that case.
absl::Status PrintScores(const Scores &scores, const OutputOptions &options,
                         std::ostream &os);

// Prints `table` with rows sorted by name and columns in table order.
// Fails like PrintScores().
absl::Status PrintTable(const ResultTable &table, const OutputOptions &options,
                        std::ostream &os);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_OUTPUT_H_
