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

#ifndef THIRD_PARTY_DIFFCOV_RESULT_TABLE_H_
#define THIRD_PARTY_DIFFCOV_RESULT_TABLE_H_

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "./defs.h"

namespace diffcov {

// One value per approach. An entry holds an error status where the value is
// undefined for that approach (e.g. DivisionUndefined); the formatter decides
// how to show it.
using Scores = std::map<ApproachName, absl::StatusOr<double>>;

// Returns the entries of `scores` in display order: defined scores first,
// highest first, then undefined ones; ties are broken by name.
std::vector<std::pair<ApproachName, absl::StatusOr<double>>> SortedForDisplay(
    const Scores &scores);

// Returns {min, max} over the defined values of `scores`, or nullopt if there
// are none.
std::optional<std::pair<double, double>> ValueRange(const Scores &scores);

// A rows x columns table of values, e.g. relcov of every approach (row)
// against every approach (column).
//
// Every cell holds either a value or the error status that made it
// undefined. Row and column order are fixed by the constructor. Cells start
// out as absl::UnknownError("unset") until Set() is called.
class ResultTable {
 public:
  ResultTable(std::vector<ApproachName> rows, std::vector<ApproachName> columns);

  const std::vector<ApproachName> &rows() const { return rows_; }
  const std::vector<ApproachName> &columns() const { return columns_; }
  size_t num_rows() const { return rows_.size(); }
  size_t num_columns() const { return columns_.size(); }

  // Index-based access, `row` < num_rows(), `column` < num_columns().
  // Different cells may be set concurrently from different threads.
  void Set(size_t row, size_t column, absl::StatusOr<double> value);
  const absl::StatusOr<double> &Get(size_t row, size_t column) const;

  // Name-based access. Returns a MissingApproach error for unknown names.
  absl::StatusOr<double> Get(const ApproachName &row,
                             const ApproachName &column) const;

  // The cells of column `column` keyed by row name.
  Scores Column(size_t column) const;

  // Returns {min, max} over all defined cells, or nullopt if there are none.
  std::optional<std::pair<double, double>> ValueRange() const;

 private:
  std::vector<ApproachName> rows_;
  std::vector<ApproachName> columns_;
  // Row-major, num_rows() * num_columns() cells.
  std::vector<absl::StatusOr<double>> cells_;
};

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_RESULT_TABLE_H_
