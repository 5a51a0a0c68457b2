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

#include "./output.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "./colormap.h"
#include "./logging.h"
#include "./result_table.h"

namespace diffcov {

namespace {

constexpr absl::string_view kLabelHeader = "approach";
constexpr int kPlainCellWidth = 10;

using ScoreRows =
    std::vector<std::pair<ApproachName, absl::StatusOr<double>>>;

// Maps table values to cell colors. Disabled unless colored LaTeX output was
// requested.
class CellColorizer {
 public:
  static absl::StatusOr<CellColorizer> Create(
      const OutputOptions &options,
      std::optional<std::pair<double, double>> range) {
    CellColorizer colorizer;
    if (options.format != OutputFormat::kLatex || !options.latex_enable_color)
      return colorizer;
    if (!IsKnownColormap(options.latex_colormap)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid colormap: '", options.latex_colormap, "'; expected one of ",
          absl::StrJoin(ColormapNames(), ", ")));
    }
    colorizer.enabled_ = true;
    colorizer.colormap_ = options.latex_colormap;
    if (range.has_value()) colorizer.range_ = *range;
    return colorizer;
  }

  // Returns `text` wrapped in \cellcolor if enabled.
  std::string Wrap(double value, absl::string_view text) const {
    if (!enabled_) return std::string(text);
    const auto [min, max] = range_;
    const double t = max <= min ? 0.5 : (value - min) / (max - min);
    const auto hex = ColormapLightHex(t, colormap_);
    CHECK(hex.ok()) << hex.status();
    return absl::StrCat("\\cellcolor[HTML]{", *hex, "}{", text, "}");
  }

 private:
  CellColorizer() = default;

  bool enabled_ = false;
  std::string colormap_;
  std::pair<double, double> range_ = {0, 0};
};

// Quotes a CSV field if needed.
std::string CsvField(absl::string_view field) {
  if (field.find_first_of(",\"\r\n") == absl::string_view::npos) {
    return std::string(field);
  }
  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string CsvRow(const std::vector<std::string> &fields) {
  return absl::StrJoin(fields, ",", [](std::string *out, const std::string &f) {
    out->append(CsvField(f));
  });
}

std::string RotatedHeader(absl::string_view text,
                          const OutputOptions &options) {
  if (!options.latex_rotate_headers.has_value()) return std::string(text);
  return absl::StrCat("\\rotcol{", text, "}");
}

// Defines \rotcol{text}, a table header cell rotated by `angle` degrees.
// Needs the adjustbox and array packages.
void PrintRotcolCommand(double angle, std::ostream &os) {
  os << "\\newcolumntype{R}[2]{%\n"
     << "    >{\\adjustbox{angle=#1,lap=\\width-(#2)}\\bgroup}%\n"
     << "    l%\n"
     << "    <{\\egroup}%\n"
     << "}\n"
     << absl::StrFormat(
            "\\newcommand*\\rotcol{\\multicolumn{1}{R{%.0f}{1em}}}%%\n",
            angle);
}

void PrintScoresPlain(const ScoreRows &rows, std::ostream &os) {
  for (const auto &[name, score] : rows) {
    if (score.ok()) {
      os << absl::StrFormat("%s: %.2f\n", name, *score);
    } else {
      os << name << ": N/A\n";
    }
  }
}

void PrintScoresCsv(const ScoreRows &rows, std::ostream &os) {
  os << kLabelHeader << ",score\n";
  for (const auto &[name, score] : rows) {
    os << CsvRow({name, score.ok() ? absl::StrFormat("%.2f", *score) : ""})
       << "\n";
  }
}

void PrintScoresLatex(const ScoreRows &rows, const CellColorizer &colorizer,
                      std::ostream &os) {
  os << "\\begin{tabular}{lr}\n";
  os << kLabelHeader << " & score \\\\\n";
  os << "\\hline\n";
  for (const auto &[name, score] : rows) {
    os << LatexEscape(name) << " & ";
    if (score.ok()) {
      os << colorizer.Wrap(*score, absl::StrFormat("%.2f", *score));
    } else {
      os << "--";
    }
    os << " \\\\\n";
  }
  os << "\\end{tabular}\n";
}

// Row indices of `table`, ordered by row name.
std::vector<size_t> SortedRowIndices(const ResultTable &table) {
  std::vector<size_t> indices(table.num_rows());
  std::iota(indices.begin(), indices.end(), 0);
  std::sort(indices.begin(), indices.end(), [&table](size_t a, size_t b) {
    return table.rows()[a] < table.rows()[b];
  });
  return indices;
}

void PrintTablePlain(const ResultTable &table, std::ostream &os) {
  size_t label_width = kLabelHeader.size();
  for (const auto &row : table.rows()) {
    label_width = std::max(label_width, row.size());
  }
  const int width = static_cast<int>(label_width);
  os << absl::StrFormat("%-*s", width, kLabelHeader);
  for (const auto &column : table.columns()) {
    os << absl::StrFormat("%*s", kPlainCellWidth, column);
  }
  os << "\n";
  for (size_t row : SortedRowIndices(table)) {
    os << absl::StrFormat("%-*s", width, table.rows()[row]);
    for (size_t column = 0; column < table.num_columns(); ++column) {
      const auto &value = table.Get(row, column);
      if (value.ok()) {
        os << absl::StrFormat("%*.5f", kPlainCellWidth, *value);
      } else {
        os << absl::StrFormat("%*s", kPlainCellWidth, "N/A");
      }
    }
    os << "\n";
  }
}

void PrintTableCsv(const ResultTable &table, std::ostream &os) {
  std::vector<std::string> header = {std::string(kLabelHeader)};
  header.insert(header.end(), table.columns().begin(), table.columns().end());
  os << CsvRow(header) << "\n";
  for (size_t row : SortedRowIndices(table)) {
    std::vector<std::string> fields = {table.rows()[row]};
    for (size_t column = 0; column < table.num_columns(); ++column) {
      const auto &value = table.Get(row, column);
      fields.push_back(value.ok() ? absl::StrFormat("%.3f", *value) : "");
    }
    os << CsvRow(fields) << "\n";
  }
}

void PrintTableLatex(const ResultTable &table, const OutputOptions &options,
                     const CellColorizer &colorizer, std::ostream &os) {
  if (options.latex_rotate_headers.has_value()) {
    PrintRotcolCommand(*options.latex_rotate_headers, os);
  }
  os << "\\begin{tabular}{l" << std::string(table.num_columns(), 'r')
     << "}\n";
  std::vector<std::string> header = {""};
  for (const auto &column : table.columns()) {
    header.push_back(RotatedHeader(LatexEscape(column), options));
  }
  os << absl::StrJoin(header, " & ") << " \\\\\n";
  os << "\\hline\n";
  for (size_t row : SortedRowIndices(table)) {
    std::vector<std::string> cells = {LatexEscape(table.rows()[row])};
    for (size_t column = 0; column < table.num_columns(); ++column) {
      const auto &value = table.Get(row, column);
      if (value.ok()) {
        cells.push_back(
            colorizer.Wrap(*value, absl::StrFormat("%.3f", *value)));
      } else {
        cells.push_back("--");
      }
    }
    os << absl::StrJoin(cells, " & ") << " \\\\\n";
  }
  os << "\\end{tabular}\n";
}

}  // namespace

absl::string_view OutputFormatName(OutputFormat format) {
  switch (format) {
    case OutputFormat::kStdout:
      return "stdout";
    case OutputFormat::kCsv:
      return "csv";
    case OutputFormat::kLatex:
      return "latex";
  }
  return "unknown";
}

bool ParseOutputFormat(absl::string_view name, OutputFormat &format) {
  for (OutputFormat candidate :
       {OutputFormat::kStdout, OutputFormat::kCsv, OutputFormat::kLatex}) {
    if (absl::EqualsIgnoreCase(name, OutputFormatName(candidate))) {
      format = candidate;
      return true;
    }
  }
  return false;
}

std::string LatexEscape(absl::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
      case '%':
      case '$':
      case '#':
      case '_':
      case '{':
      case '}':
        escaped += '\\';
        escaped += c;
        break;
      case '~':
        escaped += "\\textasciitilde{}";
        break;
      case '^':
        escaped += "\\^{}";
        break;
      case '\\':
        escaped += "\\textbackslash{}";
        break;
      default:
        escaped += c;
    }
  }
  return escaped;
}

absl::Status PrintScores(const Scores &scores, const OutputOptions &options,
                         std::ostream &os) {
  auto colorizer = CellColorizer::Create(options, ValueRange(scores));
  if (!colorizer.ok()) return colorizer.status();
  const auto rows = SortedForDisplay(scores);
  switch (options.format) {
    case OutputFormat::kStdout:
      PrintScoresPlain(rows, os);
      break;
    case OutputFormat::kCsv:
      PrintScoresCsv(rows, os);
      break;
    case OutputFormat::kLatex:
      PrintScoresLatex(rows, *colorizer, os);
      break;
  }
  return absl::OkStatus();
}

absl::Status PrintTable(const ResultTable &table, const OutputOptions &options,
                        std::ostream &os) {
  auto colorizer = CellColorizer::Create(options, table.ValueRange());
  if (!colorizer.ok()) return colorizer.status();
  switch (options.format) {
    case OutputFormat::kStdout:
      PrintTablePlain(table, os);
      break;
    case OutputFormat::kCsv:
      PrintTableCsv(table, os);
      break;
    case OutputFormat::kLatex:
      PrintTableLatex(table, options, *colorizer, os);
      break;
  }
  return absl::OkStatus();
}

}  // namespace diffcov
