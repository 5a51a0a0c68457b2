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

// Reducers select how relcov aggregates across trials.
//
// A collection reducer folds the trials of the reference approach into a
// single reference set: UNION is "reachable at best", INTERSECTION is
// "reached by every trial".
// A value reducer folds the per-trial relcov values of the measured approach
// into one number.
//
// Both are closed enumerations dispatched through a table of pure functions.
// There is no process-wide default: callers pass the reducers they want.

#ifndef THIRD_PARTY_DIFFCOV_REDUCER_H_
#define THIRD_PARTY_DIFFCOV_REDUCER_H_

#include <array>
#include <cstddef>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./status_util.h"

namespace diffcov {

enum class ValueReducer : size_t { kMedian, kMin, kMax, kMean };
enum class CollectionReducer : size_t { kUnion, kIntersection };

inline constexpr size_t kNumValueReducers = 4;
inline constexpr size_t kNumCollectionReducers = 2;

// Canonical lowercase names: "median", "min", "max", "mean";
// "union", "intersection".
absl::string_view ValueReducerName(ValueReducer reducer);
absl::string_view CollectionReducerName(CollectionReducer reducer);

// Parses a reducer name (case-insensitive). "average" is accepted for kMean.
// Returns false and leaves `reducer` untouched on unknown names.
bool ParseValueReducer(absl::string_view name, ValueReducer &reducer);
bool ParseCollectionReducer(absl::string_view name,
                            CollectionReducer &reducer);

// Folds `values` into one number.
// kMedian: the middle element of the sorted values; for an even number of
// values, the mean of the two middle elements.
// kMin, kMax, kMean: the minimum, maximum and arithmetic mean.
// Returns an EmptyInput error if `values` is empty.
absl::StatusOr<double> ReduceValues(absl::Span<const double> values,
                                    ValueReducer reducer);

namespace internal {

template <typename EdgeId>
EdgeSet<EdgeId> UnionOf(absl::Span<const EdgeSet<EdgeId> *const> sets) {
  EdgeSet<EdgeId> result;
  for (const auto *set : sets) result.insert(set->begin(), set->end());
  return result;
}

template <typename EdgeId>
EdgeSet<EdgeId> IntersectionOf(absl::Span<const EdgeSet<EdgeId> *const> sets) {
  // Start from the smallest set: the result can't be larger.
  const EdgeSet<EdgeId> *smallest = sets.front();
  for (const auto *set : sets) {
    if (set->size() < smallest->size()) smallest = set;
  }
  EdgeSet<EdgeId> result;
  for (const auto &edge : *smallest) {
    bool in_all = true;
    for (const auto *set : sets) {
      if (set != smallest && !set->contains(edge)) {
        in_all = false;
        break;
      }
    }
    if (in_all) result.insert(edge);
  }
  return result;
}

}  // namespace internal

// Folds `sets` into one set: their union or their intersection.
// Returns an EmptyInput error if `sets` is empty (for both reducers: the
// intersection of zero sets is undefined rather than "everything").
template <typename EdgeId>
absl::StatusOr<EdgeSet<EdgeId>> ReduceCollection(
    absl::Span<const EdgeSet<EdgeId> *const> sets, CollectionReducer reducer) {
  using ReduceFn = EdgeSet<EdgeId> (*)(absl::Span<const EdgeSet<EdgeId> *const>);
  static constexpr std::array<ReduceFn, kNumCollectionReducers> kReducers = {
      &internal::UnionOf<EdgeId>,         // kUnion
      &internal::IntersectionOf<EdgeId>,  // kIntersection
  };
  if (sets.empty()) {
    return EmptyInputError(absl::StrCat("collection reducer '",
                                        CollectionReducerName(reducer),
                                        "' applied to zero sets"));
  }
  return kReducers[static_cast<size_t>(reducer)](sets);
}

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_REDUCER_H_
