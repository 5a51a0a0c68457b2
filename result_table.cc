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

#include "./result_table.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./logging.h"
#include "./status_util.h"

namespace diffcov {

namespace {

// Extends `range` to cover `value`.
void ExtendRange(std::optional<std::pair<double, double>> &range,
                 double value) {
  if (!range.has_value()) {
    range.emplace(value, value);
    return;
  }
  range->first = std::min(range->first, value);
  range->second = std::max(range->second, value);
}

std::optional<size_t> IndexOf(const std::vector<ApproachName> &names,
                              const ApproachName &name) {
  auto it = std::find(names.begin(), names.end(), name);
  if (it == names.end()) return std::nullopt;
  return static_cast<size_t>(it - names.begin());
}

}  // namespace

std::vector<std::pair<ApproachName, absl::StatusOr<double>>> SortedForDisplay(
    const Scores &scores) {
  std::vector<std::pair<ApproachName, absl::StatusOr<double>>> sorted(
      scores.begin(), scores.end());
  // `scores` is ordered by name, so a stable sort keeps name order for ties.
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const auto &a, const auto &b) {
                     if (a.second.ok() != b.second.ok()) return a.second.ok();
                     if (!a.second.ok()) return false;
                     return *a.second > *b.second;
                   });
  return sorted;
}

std::optional<std::pair<double, double>> ValueRange(const Scores &scores) {
  std::optional<std::pair<double, double>> range;
  for (const auto &[name, score] : scores) {
    if (score.ok()) ExtendRange(range, *score);
  }
  return range;
}

ResultTable::ResultTable(std::vector<ApproachName> rows,
                         std::vector<ApproachName> columns)
    : rows_(std::move(rows)),
      columns_(std::move(columns)),
      cells_(rows_.size() * columns_.size(), absl::UnknownError("unset")) {}

void ResultTable::Set(size_t row, size_t column, absl::StatusOr<double> value) {
  CHECK_LT(row, rows_.size());
  CHECK_LT(column, columns_.size());
  cells_[row * columns_.size() + column] = std::move(value);
}

const absl::StatusOr<double> &ResultTable::Get(size_t row,
                                               size_t column) const {
  CHECK_LT(row, rows_.size());
  CHECK_LT(column, columns_.size());
  return cells_[row * columns_.size() + column];
}

absl::StatusOr<double> ResultTable::Get(const ApproachName &row,
                                        const ApproachName &column) const {
  auto row_index = IndexOf(rows_, row);
  if (!row_index.has_value()) {
    return MissingApproachError(absl::StrCat("no row '", row, "' in table"));
  }
  auto column_index = IndexOf(columns_, column);
  if (!column_index.has_value()) {
    return MissingApproachError(
        absl::StrCat("no column '", column, "' in table"));
  }
  return Get(*row_index, *column_index);
}

Scores ResultTable::Column(size_t column) const {
  Scores scores;
  for (size_t row = 0; row < rows_.size(); ++row) {
    scores.emplace(rows_[row], Get(row, column));
  }
  return scores;
}

std::optional<std::pair<double, double>> ResultTable::ValueRange() const {
  std::optional<std::pair<double, double>> range;
  for (const auto &cell : cells_) {
    if (cell.ok()) ExtendRange(range, *cell);
  }
  return range;
}

}  // namespace diffcov
