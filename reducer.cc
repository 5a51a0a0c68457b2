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

#include "./reducer.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "./status_util.h"

namespace diffcov {

namespace {

// All functions below expect a non-empty `values`.

double Median(absl::Span<const double> values) {
  std::vector<double> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());
  const size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) return sorted[mid];
  return (sorted[mid - 1] + sorted[mid]) / 2;
}

double Min(absl::Span<const double> values) {
  return *std::min_element(values.begin(), values.end());
}

double Max(absl::Span<const double> values) {
  return *std::max_element(values.begin(), values.end());
}

double Mean(absl::Span<const double> values) {
  return std::accumulate(values.begin(), values.end(), 0.) /
         static_cast<double>(values.size());
}

using ValueReduceFn = double (*)(absl::Span<const double>);

// Indexed by ValueReducer.
constexpr std::array<ValueReduceFn, kNumValueReducers> kValueReducers = {
    &Median,
    &Min,
    &Max,
    &Mean,
};

constexpr std::array<absl::string_view, kNumValueReducers> kValueReducerNames =
    {"median", "min", "max", "mean"};

constexpr std::array<absl::string_view, kNumCollectionReducers>
    kCollectionReducerNames = {"union", "intersection"};

}  // namespace

absl::string_view ValueReducerName(ValueReducer reducer) {
  return kValueReducerNames[static_cast<size_t>(reducer)];
}

absl::string_view CollectionReducerName(CollectionReducer reducer) {
  return kCollectionReducerNames[static_cast<size_t>(reducer)];
}

bool ParseValueReducer(absl::string_view name, ValueReducer &reducer) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "average") {
    reducer = ValueReducer::kMean;
    return true;
  }
  for (size_t i = 0; i < kNumValueReducers; ++i) {
    if (lower == kValueReducerNames[i]) {
      reducer = static_cast<ValueReducer>(i);
      return true;
    }
  }
  return false;
}

bool ParseCollectionReducer(absl::string_view name,
                            CollectionReducer &reducer) {
  const std::string lower = absl::AsciiStrToLower(name);
  for (size_t i = 0; i < kNumCollectionReducers; ++i) {
    if (lower == kCollectionReducerNames[i]) {
      reducer = static_cast<CollectionReducer>(i);
      return true;
    }
  }
  return false;
}

absl::StatusOr<double> ReduceValues(absl::Span<const double> values,
                                    ValueReducer reducer) {
  if (values.empty()) {
    return EmptyInputError(absl::StrCat("value reducer '",
                                        ValueReducerName(reducer),
                                        "' applied to zero values"));
  }
  return kValueReducers[static_cast<size_t>(reducer)](values);
}

}  // namespace diffcov
