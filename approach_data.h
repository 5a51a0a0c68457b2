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

#ifndef THIRD_PARTY_DIFFCOV_APPROACH_DATA_H_
#define THIRD_PARTY_DIFFCOV_APPROACH_DATA_H_

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./logging.h"
#include "./reducer.h"
#include "./status_util.h"
#include "./trial_coverage.h"

namespace diffcov {

// Coverage of one approach (fuzzer, seed corpus, ...), grouped by trial.
//
// An approach always has at least one trial. Individual trials may be empty
// (e.g. a run that crashed before producing coverage).
// The upper and lower bounds are derived from the trials on every call;
// nothing is cached, and the object never changes after construction.
//
// Thread-compatible; all const methods are safe to call concurrently.
template <typename EdgeId>
class ApproachData {
 public:
  using Trials = std::map<TrialId, TrialCoverage<EdgeId>>;

  // Creates the approach `name` from `trials`.
  // Returns an EmptyInput error if `trials` is empty.
  static absl::StatusOr<ApproachData> Create(ApproachName name, Trials trials) {
    if (trials.empty()) {
      return EmptyInputError(
          absl::StrCat("approach '", name, "' has no trials"));
    }
    return ApproachData(std::move(name), std::move(trials));
  }

  // Same as above, but from raw hit counts: only edges hit at least once
  // become part of a trial's coverage.
  static absl::StatusOr<ApproachData> FromHitCounts(
      ApproachName name,
      const std::map<TrialId, HitCounts<EdgeId>> &hit_counts) {
    Trials trials;
    for (const auto &[trial_id, counts] : hit_counts) {
      trials.emplace(trial_id, TrialCoverage<EdgeId>::FromHitCounts(counts));
    }
    return Create(std::move(name), std::move(trials));
  }

  const ApproachName &name() const { return name_; }
  const Trials &trials() const { return trials_; }
  size_t num_trials() const { return trials_.size(); }

  // Edges reached by at least one trial. Empty iff all trials are empty.
  EdgeSet<EdgeId> UpperBound() const {
    return Reduce(CollectionReducer::kUnion);
  }

  // Edges reached by every trial. May be empty.
  EdgeSet<EdgeId> LowerBound() const {
    return Reduce(CollectionReducer::kIntersection);
  }

  // Folds all trials with `reducer`. Never fails: there is at least one trial.
  EdgeSet<EdgeId> Reduce(CollectionReducer reducer) const {
    auto reduced = ReduceCollection<EdgeId>(TrialEdgeSets(), reducer);
    CHECK(reduced.ok()) << reduced.status();
    return *std::move(reduced);
  }

  // Relcov of every trial of `this` against `reference`, in trial id order.
  // Returns a DivisionUndefined error if `reference` is empty.
  absl::StatusOr<std::vector<double>> PerTrialRelcov(
      const EdgeSet<EdgeId> &reference) const {
    std::vector<double> values;
    values.reserve(trials_.size());
    for (const auto &[trial_id, coverage] : trials_) {
      auto value = coverage.RelcovAgainst(reference);
      if (!value.ok()) {
        return DivisionUndefinedError(
            absl::StrCat("relcov of '", name_, "/", trial_id,
                         "': ", value.status().message()));
      }
      values.push_back(*value);
    }
    return values;
  }

  // How much of `other` is covered by `this`:
  // reduces the trials of `other` with `collection_reducer` into a reference
  // set, computes the relcov of every trial of `this` against it, and folds
  // those values with `value_reducer`.
  //
  // Returns a DivisionUndefined error if the reference set is empty (e.g.
  // `other` has no coverage at all, or no edge common to all its trials under
  // kIntersection). The result is never substituted with 0.
  absl::StatusOr<double> RelcovAgainst(
      const ApproachData &other, ValueReducer value_reducer,
      CollectionReducer collection_reducer) const {
    const EdgeSet<EdgeId> reference = other.Reduce(collection_reducer);
    if (reference.empty()) {
      return DivisionUndefinedError(absl::StrCat(
          "relcov of '", name_, "' against '", other.name_, "': the ",
          CollectionReducerName(collection_reducer), " of its trials is empty"));
    }
    auto values = PerTrialRelcov(reference);
    if (!values.ok()) return values.status();
    return ReduceValues(*values, value_reducer);
  }

  // Number of trials with non-empty coverage.
  size_t NumTrialsWithResult() const {
    size_t result = 0;
    for (const auto &[trial_id, coverage] : trials_) {
      if (!coverage.empty()) ++result;
    }
    return result;
  }

  // Number of trials that reached `edge`.
  size_t NumTrialsHitting(const EdgeId &edge) const {
    size_t result = 0;
    for (const auto &[trial_id, coverage] : trials_) {
      if (coverage.Contains(edge)) ++result;
    }
    return result;
  }

  // Same trial ids with the same coverage. The name is not compared.
  bool operator==(const ApproachData &other) const {
    return trials_ == other.trials_;
  }
  bool operator!=(const ApproachData &other) const {
    return !(*this == other);
  }

 private:
  ApproachData(ApproachName name, Trials trials)
      : name_(std::move(name)), trials_(std::move(trials)) {}

  std::vector<const EdgeSet<EdgeId> *> TrialEdgeSets() const {
    std::vector<const EdgeSet<EdgeId> *> sets;
    sets.reserve(trials_.size());
    for (const auto &[trial_id, coverage] : trials_) {
      sets.push_back(&coverage.edges());
    }
    return sets;
  }

  ApproachName name_;
  Trials trials_;
};

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_APPROACH_DATA_H_
