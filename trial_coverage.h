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

#ifndef THIRD_PARTY_DIFFCOV_TRIAL_COVERAGE_H_
#define THIRD_PARTY_DIFFCOV_TRIAL_COVERAGE_H_

#include <cstddef>
#include <initializer_list>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./defs.h"
#include "./status_util.h"

namespace diffcov {

// Returns the number of elements of `a` that are also in `b`.
template <typename EdgeId>
size_t CountShared(const EdgeSet<EdgeId> &a, const EdgeSet<EdgeId> &b) {
  // Iterate the smaller set, look up in the larger one.
  if (a.size() > b.size()) return CountShared(b, a);
  size_t shared = 0;
  for (const auto &edge : a) {
    if (b.contains(edge)) ++shared;
  }
  return shared;
}

// Relative coverage of `coverage` with respect to `reference`:
// |coverage ∩ reference| / |reference|, a value in [0, 1].
// Returns a DivisionUndefined error if `reference` is empty.
template <typename EdgeId>
absl::StatusOr<double> Relcov(const EdgeSet<EdgeId> &coverage,
                              const EdgeSet<EdgeId> &reference) {
  if (reference.empty()) {
    return DivisionUndefinedError(
        absl::StrCat("relcov against an empty reference set (coverage has ",
                     coverage.size(), " edges)"));
  }
  return static_cast<double>(CountShared(coverage, reference)) /
         static_cast<double>(reference.size());
}

// The set of edges reached by one trial of an approach.
// Only presence matters: hit counts above 1 are discarded on construction.
// Immutable.
template <typename EdgeId>
class TrialCoverage {
 public:
  TrialCoverage() = default;
  explicit TrialCoverage(EdgeSet<EdgeId> edges) : edges_(std::move(edges)) {}
  TrialCoverage(std::initializer_list<EdgeId> edges) : edges_(edges) {}

  // Keeps the edges of `hit_counts` with a count of at least 1.
  static TrialCoverage FromHitCounts(const HitCounts<EdgeId> &hit_counts) {
    EdgeSet<EdgeId> edges;
    edges.reserve(hit_counts.size());
    for (const auto &[edge, count] : hit_counts) {
      if (count > 0) edges.insert(edge);
    }
    return TrialCoverage(std::move(edges));
  }

  const EdgeSet<EdgeId> &edges() const { return edges_; }
  size_t size() const { return edges_.size(); }
  bool empty() const { return edges_.empty(); }
  bool Contains(const EdgeId &edge) const { return edges_.contains(edge); }

  // Relcov of this trial against `reference`, see Relcov() above.
  absl::StatusOr<double> RelcovAgainst(const EdgeSet<EdgeId> &reference) const {
    return Relcov(edges_, reference);
  }

  bool operator==(const TrialCoverage &other) const {
    return edges_ == other.edges_;
  }
  bool operator!=(const TrialCoverage &other) const {
    return !(*this == other);
  }

 private:
  EdgeSet<EdgeId> edges_;
};

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_TRIAL_COVERAGE_H_
