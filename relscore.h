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

#ifndef THIRD_PARTY_DIFFCOV_RELSCORE_H_
#define THIRD_PARTY_DIFFCOV_RELSCORE_H_

#include <cstddef>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./approach_data.h"
#include "./campaign.h"
#include "./defs.h"
#include "./result_table.h"
#include "./status_util.h"

namespace diffcov {

// Computes relscores: per approach, the sum over all edges of
//
//   relscore(a, e) = missing(e) * hits(a, e) / trials_with_result(a)
//
// where
//   missing(e)            is the number of approaches none of whose trials
//                         reached `e`,
//   hits(a, e)            is the number of trials of `a` that reached `e`,
//   trials_with_result(a) is the number of trials of `a` with non-empty
//                         coverage.
//
// Edges reached by every approach score 0 for everyone; reaching an edge that
// many other approaches miss, and reaching it reliably, scores high.
// Empty trials are left out of the denominator. An approach with no
// non-empty trial at all has an undefined score (DivisionUndefined); it still
// counts towards missing(e) for every edge.
//
// The engine reads `campaign` only in the constructor and never holds on to
// it. Thread-compatible.
template <typename EdgeId>
class RelscoreEngine {
 public:
  explicit RelscoreEngine(const Campaign<EdgeId> &campaign) {
    std::vector<EdgeSet<EdgeId>> uppers;
    uppers.reserve(campaign.size());
    for (const auto &[name, approach] : campaign.approaches()) {
      uppers.push_back(approach.UpperBound());
      for (const auto &edge : uppers.back()) missing_.try_emplace(edge, 0);
    }
    for (auto &[edge, missing] : missing_) {
      for (const auto &upper : uppers) {
        if (!upper.contains(edge)) ++missing;
      }
    }
    for (const auto &[name, approach] : campaign.approaches()) {
      scores_.emplace(name, ComputeScore(approach));
    }
  }

  // Number of approaches that never reached `edge`. Edges not seen anywhere in
  // the campaign return 0 (they carry no differential information).
  size_t Missing(const EdgeId &edge) const {
    auto it = missing_.find(edge);
    return it == missing_.end() ? 0 : it->second;
  }

  // Number of distinct edges reached anywhere in the campaign.
  size_t NumEdges() const { return missing_.size(); }

  // relscore(approach, edge) as defined above.
  // Returns a DivisionUndefined error if `approach` has no trial with
  // non-empty coverage.
  absl::StatusOr<double> EdgeScore(const ApproachData<EdgeId> &approach,
                                   const EdgeId &edge) const {
    const size_t trials_with_result = approach.NumTrialsWithResult();
    if (trials_with_result == 0) return NoResultError(approach);
    return static_cast<double>(Missing(edge)) *
           static_cast<double>(approach.NumTrialsHitting(edge)) /
           static_cast<double>(trials_with_result);
  }

  // Sum of EdgeScore() over all edges, for every approach of the campaign.
  const Scores &scores() const { return scores_; }

 private:
  static absl::Status NoResultError(const ApproachData<EdgeId> &approach) {
    return DivisionUndefinedError(
        absl::StrCat("approach '", approach.name(), "' has no trial with ",
                     "non-empty coverage (", approach.num_trials(),
                     " trials); excluded from relscore"));
  }

  absl::StatusOr<double> ComputeScore(
      const ApproachData<EdgeId> &approach) const {
    const size_t trials_with_result = approach.NumTrialsWithResult();
    if (trials_with_result == 0) return NoResultError(approach);
    // Only edges reached by `approach` can contribute, so iterate its trials
    // instead of all edges: sum_e missing(e) * hits(e) = sum over trials t,
    // over edges e in t, of missing(e).
    double score = 0;
    for (const auto &[trial_id, coverage] : approach.trials()) {
      for (const auto &edge : coverage.edges()) {
        score += static_cast<double>(Missing(edge));
      }
    }
    return score / static_cast<double>(trials_with_result);
  }

  absl::flat_hash_map<EdgeId, size_t> missing_;  // Edge => missing(edge).
  Scores scores_;
};

// relscore of every approach of `campaign`.
template <typename EdgeId>
Scores RelscoreAll(const Campaign<EdgeId> &campaign) {
  return RelscoreEngine<EdgeId>(campaign).scores();
}

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_RELSCORE_H_
