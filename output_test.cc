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

#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "./colormap.h"
#include "./logging.h"
#include "./result_table.h"
#include "./status_util.h"
#include "./test_util.h"

namespace diffcov {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

OutputOptions WithFormat(OutputFormat format) {
  OutputOptions options;
  options.format = format;
  return options;
}

std::string ScoresToString(const Scores &scores, const OutputOptions &options) {
  std::ostringstream os;
  const absl::Status status = PrintScores(scores, options, os);
  CHECK(status.ok()) << status;
  return os.str();
}

std::string TableToString(const ResultTable &table,
                          const OutputOptions &options) {
  std::ostringstream os;
  const absl::Status status = PrintTable(table, options, os);
  CHECK(status.ok()) << status;
  return os.str();
}

Scores SampleScores() {
  return {
      {"y_z", 0.5},
      {"w", DivisionUndefinedError("no coverage")},
      {"x", 1.0},
  };
}

// Rows are deliberately out of order; output sorts them by name.
ResultTable SampleTable() {
  ResultTable table({"b_c", "a"}, {"a", "b_c"});
  table.Set(0, 0, 0.25);
  table.Set(0, 1, 1.0);
  table.Set(1, 0, 1.0);
  table.Set(1, 1, DivisionUndefinedError("empty reference"));
  return table;
}

TEST(OutputFormat, Parse) {
  OutputFormat format = OutputFormat::kStdout;
  EXPECT_TRUE(ParseOutputFormat("csv", format));
  EXPECT_EQ(format, OutputFormat::kCsv);
  EXPECT_TRUE(ParseOutputFormat("LaTeX", format));
  EXPECT_EQ(format, OutputFormat::kLatex);
  EXPECT_TRUE(ParseOutputFormat("stdout", format));
  EXPECT_EQ(format, OutputFormat::kStdout);
  EXPECT_FALSE(ParseOutputFormat("json", format));
  EXPECT_FALSE(ParseOutputFormat("", format));
  EXPECT_EQ(format, OutputFormat::kStdout);
  EXPECT_EQ(OutputFormatName(OutputFormat::kLatex), "latex");
}

TEST(LatexEscape, SpecialCharacters) {
  EXPECT_EQ(LatexEscape("afl++"), "afl++");
  EXPECT_EQ(LatexEscape("fuzzer_a"), "fuzzer\\_a");
  EXPECT_EQ(LatexEscape("50% & $5 #1 {x}"),
            "50\\% \\& \\$5 \\#1 \\{x\\}");
  EXPECT_EQ(LatexEscape("a~b^c\\d"),
            "a\\textasciitilde{}b\\^{}c\\textbackslash{}d");
}

TEST(PrintScores, Plain) {
  EXPECT_EQ(ScoresToString(SampleScores(), WithFormat(OutputFormat::kStdout)),
            "x: 1.00\n"
            "y_z: 0.50\n"
            "w: N/A\n");
  EXPECT_EQ(ScoresToString({}, WithFormat(OutputFormat::kStdout)), "");
}

TEST(PrintScores, Csv) {
  Scores scores = SampleScores();
  scores.emplace("q,\"r\"", 0.25);
  EXPECT_EQ(ScoresToString(scores, WithFormat(OutputFormat::kCsv)),
            "approach,score\n"
            "x,1.00\n"
            "y_z,0.50\n"
            "\"q,\"\"r\"\"\",0.25\n"
            "w,\n");
}

TEST(PrintScores, Latex) {
  EXPECT_EQ(ScoresToString(SampleScores(), WithFormat(OutputFormat::kLatex)),
            "\\begin{tabular}{lr}\n"
            "approach & score \\\\\n"
            "\\hline\n"
            "x & 1.00 \\\\\n"
            "y\\_z & 0.50 \\\\\n"
            "w & -- \\\\\n"
            "\\end{tabular}\n");
}

TEST(PrintScores, LatexColor) {
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_enable_color = true;
  options.latex_colormap = "cividis";
  const std::string output = ScoresToString(SampleScores(), options);
  auto top = ColormapLightHex(1.0, "cividis");
  auto bottom = ColormapLightHex(0.0, "cividis");
  ASSERT_OK(top);
  ASSERT_OK(bottom);
  EXPECT_THAT(output,
              HasSubstr(absl::StrCat("x & \\cellcolor[HTML]{", *top,
                                     "}{1.00} \\\\\n")));
  EXPECT_THAT(output,
              HasSubstr(absl::StrCat("y\\_z & \\cellcolor[HTML]{", *bottom,
                                     "}{0.50} \\\\\n")));
  EXPECT_THAT(output, HasSubstr("w & -- \\\\\n"));
}

TEST(PrintScores, ColorIsLatexOnly) {
  OutputOptions options = WithFormat(OutputFormat::kCsv);
  options.latex_enable_color = true;
  EXPECT_THAT(ScoresToString(SampleScores(), options),
              Not(HasSubstr("cellcolor")));
}

TEST(PrintScores, UnknownColormapPrintsNothing) {
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_enable_color = true;
  options.latex_colormap = "jet";
  std::ostringstream os;
  EXPECT_TRUE(absl::IsInvalidArgument(PrintScores(SampleScores(), options, os)));
  EXPECT_EQ(os.str(), "");

  // Without colors the colormap is never looked at.
  options.latex_enable_color = false;
  EXPECT_OK(PrintScores(SampleScores(), options, os));
}

TEST(PrintTable, Plain) {
  EXPECT_EQ(TableToString(SampleTable(), WithFormat(OutputFormat::kStdout)),
            "approach         a       b_c\n"
            "a          1.00000       N/A\n"
            "b_c        0.25000   1.00000\n");
}

TEST(PrintTable, PlainLabelColumnFitsLongNames) {
  ResultTable table({"a_very_long_fuzzer"}, {"x"});
  table.Set(0, 0, 0.5);
  EXPECT_EQ(TableToString(table, WithFormat(OutputFormat::kStdout)),
            "approach                   x\n"
            "a_very_long_fuzzer   0.50000\n");
}

TEST(PrintTable, Csv) {
  EXPECT_EQ(TableToString(SampleTable(), WithFormat(OutputFormat::kCsv)),
            "approach,a,b_c\n"
            "a,1.000,\n"
            "b_c,0.250,1.000\n");
}

TEST(PrintTable, Latex) {
  EXPECT_EQ(TableToString(SampleTable(), WithFormat(OutputFormat::kLatex)),
            "\\begin{tabular}{lrr}\n"
            " & a & b\\_c \\\\\n"
            "\\hline\n"
            "a & 1.000 & -- \\\\\n"
            "b\\_c & 0.250 & 1.000 \\\\\n"
            "\\end{tabular}\n");
}

TEST(PrintTable, LatexRotatedHeaders) {
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_rotate_headers = 45;
  const std::string output = TableToString(SampleTable(), options);
  EXPECT_EQ(output,
            "\\newcolumntype{R}[2]{%\n"
            "    >{\\adjustbox{angle=#1,lap=\\width-(#2)}\\bgroup}%\n"
            "    l%\n"
            "    <{\\egroup}%\n"
            "}\n"
            "\\newcommand*\\rotcol{\\multicolumn{1}{R{45}{1em}}}%\n"
            "\\begin{tabular}{lrr}\n"
            " & \\rotcol{a} & \\rotcol{b\\_c} \\\\\n"
            "\\hline\n"
            "a & 1.000 & -- \\\\\n"
            "b\\_c & 0.250 & 1.000 \\\\\n"
            "\\end{tabular}\n");
}

TEST(PrintTable, LatexColorNormalizesOverTheTable) {
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_enable_color = true;
  const std::string output = TableToString(SampleTable(), options);
  auto top = ColormapLightHex(1.0, "viridis");
  auto bottom = ColormapLightHex(0.0, "viridis");
  ASSERT_OK(top);
  ASSERT_OK(bottom);
  EXPECT_THAT(output, HasSubstr(absl::StrCat(
                          "a & \\cellcolor[HTML]{", *top, "}{1.000} & -- \\\\\n")));
  EXPECT_THAT(output,
              HasSubstr(absl::StrCat("b\\_c & \\cellcolor[HTML]{", *bottom,
                                     "}{0.250} & \\cellcolor[HTML]{", *top,
                                     "}{1.000} \\\\\n")));
}

TEST(PrintTable, LatexColorOfConstantTableIsMidpoint) {
  ResultTable table({"a", "b"}, {"a"});
  table.Set(0, 0, 1.0);
  table.Set(1, 0, 1.0);
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_enable_color = true;
  auto mid = ColormapLightHex(0.5, "viridis");
  ASSERT_OK(mid);
  EXPECT_THAT(TableToString(table, options),
              HasSubstr(absl::StrCat("b & \\cellcolor[HTML]{", *mid,
                                     "}{1.000} \\\\\n")));
}

TEST(PrintTable, UnknownColormapPrintsNothing) {
  OutputOptions options = WithFormat(OutputFormat::kLatex);
  options.latex_enable_color = true;
  options.latex_colormap = "rainbow";
  options.latex_rotate_headers = 90;
  std::ostringstream os;
  EXPECT_TRUE(absl::IsInvalidArgument(PrintTable(SampleTable(), options, os)));
  EXPECT_EQ(os.str(), "");
}

}  // namespace
}  // namespace diffcov
