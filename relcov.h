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

// Campaign-level relcov computations.
//
// Everything here is built on one primitive, RelcovAgainst(a, b): how much of
// b's coverage (b's trials folded by a collection reducer) is reached by the
// trials of a (folded by a value reducer). The argument order matters and is
// easy to get backwards:
//   * performance of `a` over a reference `r`  = RelcovAgainst(a, r);
//   * reliability of `a`                       = RelcovAgainst(a, a), union;
//   * reach of `a` from an input corpus `c`    = RelcovAgainst(c, a),
//     i.e. how much of what `a` reached was already reached by the corpus.

#ifndef THIRD_PARTY_DIFFCOV_RELCOV_H_
#define THIRD_PARTY_DIFFCOV_RELCOV_H_

#include <algorithm>
#include <cstddef>
#include <thread>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./approach_data.h"
#include "./campaign.h"
#include "./defs.h"
#include "./logging.h"
#include "./reducer.h"
#include "./result_table.h"
#include "./status_util.h"

namespace diffcov {

// RelcovAgainst() of the approaches named `approach` and `other`.
// Returns a MissingApproach error if either is not in `campaign`.
template <typename EdgeId>
absl::StatusOr<double> RelcovAgainst(const Campaign<EdgeId> &campaign,
                                     const ApproachName &approach,
                                     const ApproachName &other,
                                     ValueReducer value_reducer,
                                     CollectionReducer collection_reducer) {
  auto approach_data = campaign.Get(approach);
  if (!approach_data.ok()) return approach_data.status();
  auto other_data = campaign.Get(other);
  if (!other_data.ok()) return other_data.status();
  return (*approach_data)
      ->RelcovAgainst(**other_data, value_reducer, collection_reducer);
}

// Computes table[i][j] = RelcovAgainst(a_i, a_j) for all approaches a_i, a_j
// of `campaign`, rows and columns in name order.
// A cell whose value is undefined holds the error (e.g. DivisionUndefined if
// a_j has no coverage).
// Cells are independent; rows are spread over `num_threads` threads.
template <typename EdgeId>
ResultTable RelcovTable(const Campaign<EdgeId> &campaign,
                        ValueReducer value_reducer,
                        CollectionReducer collection_reducer,
                        size_t num_threads = 1) {
  const std::vector<ApproachName> names = campaign.Names();
  std::vector<const ApproachData<EdgeId> *> approaches;
  approaches.reserve(names.size());
  for (const auto &[name, approach] : campaign.approaches()) {
    approaches.push_back(&approach);
  }
  ResultTable table(names, names);

  // Thread `thread_idx` fills rows thread_idx, thread_idx + num_threads, ...
  // No two threads write the same cell.
  auto fill_rows = [&](size_t thread_idx, size_t stride) {
    for (size_t row = thread_idx; row < approaches.size(); row += stride) {
      for (size_t column = 0; column < approaches.size(); ++column) {
        table.Set(row, column,
                  approaches[row]->RelcovAgainst(
                      *approaches[column], value_reducer, collection_reducer));
      }
    }
  };

  num_threads = std::clamp<size_t>(num_threads, 1, approaches.size());
  if (num_threads == 1) {
    fill_rows(0, 1);
    return table;
  }
  std::vector<std::thread> threads(num_threads);
  for (size_t thread_idx = 0; thread_idx < num_threads; ++thread_idx) {
    threads[thread_idx] = std::thread(fill_rows, thread_idx, num_threads);
  }
  for (auto &thread : threads) thread.join();
  return table;
}

// Reliability of every approach: the relcov of its trials against the union
// of its own trials, folded with `value_reducer`.
template <typename EdgeId>
Scores Reliability(const Campaign<EdgeId> &campaign,
                   ValueReducer value_reducer) {
  Scores scores;
  for (const auto &[name, approach] : campaign.approaches()) {
    scores.emplace(name, approach.RelcovAgainst(approach, value_reducer,
                                                CollectionReducer::kUnion));
  }
  return scores;
}

// Performance of every approach other than `reference` over `reference`:
// RelcovAgainst(approach, reference).
// Returns a MissingApproach error if `reference` is not in `campaign`.
template <typename EdgeId>
absl::StatusOr<Scores> PerformanceOverApproach(
    const Campaign<EdgeId> &campaign, const ApproachName &reference,
    ValueReducer value_reducer, CollectionReducer collection_reducer) {
  auto reference_data = campaign.Get(reference);
  if (!reference_data.ok()) return reference_data.status();
  Scores scores;
  for (const auto &[name, approach] : campaign.approaches()) {
    if (name == reference) continue;
    scores.emplace(name, approach.RelcovAgainst(**reference_data, value_reducer,
                                                collection_reducer));
  }
  return scores;
}

// Names of the approaches with exactly one trial: the candidates for input
// corpora (e.g. a "seeds" directory holding a single coverage file).
template <typename EdgeId>
std::vector<ApproachName> CorpusCandidates(const Campaign<EdgeId> &campaign) {
  std::vector<ApproachName> corpora;
  for (const auto &[name, approach] : campaign.approaches()) {
    if (approach.num_trials() == 1) corpora.push_back(name);
  }
  return corpora;
}

// Reach of every approach (including `corpus` itself) from the input corpus
// `corpus`: RelcovAgainst(corpus, approach).
// Returns a MissingApproach error if `corpus` is not in `campaign` or does not
// have exactly one trial.
template <typename EdgeId>
absl::StatusOr<Scores> ReachFromCorpus(const Campaign<EdgeId> &campaign,
                                       const ApproachName &corpus,
                                       ValueReducer value_reducer,
                                       CollectionReducer collection_reducer) {
  auto corpus_data = campaign.Get(corpus);
  if (!corpus_data.ok()) return corpus_data.status();
  if ((*corpus_data)->num_trials() != 1) {
    return MissingApproachError(absl::StrCat(
        "input corpus '", corpus, "' must have exactly one trial, has ",
        (*corpus_data)->num_trials()));
  }
  Scores scores;
  for (const auto &[name, approach] : campaign.approaches()) {
    scores.emplace(name, (*corpus_data)->RelcovAgainst(
                             approach, value_reducer, collection_reducer));
  }
  return scores;
}

// Reach of every approach (rows) from every corpus candidate (columns):
// cell[a][c] = RelcovAgainst(c, a).
// Note that this is the transpose of the corresponding RelcovTable() cells,
// so that each column reads as one ReachFromCorpus().
// Returns a MissingApproach error if the campaign has no corpus candidates.
template <typename EdgeId>
absl::StatusOr<ResultTable> ReachTable(const Campaign<EdgeId> &campaign,
                                       ValueReducer value_reducer,
                                       CollectionReducer collection_reducer) {
  const std::vector<ApproachName> corpora = CorpusCandidates(campaign);
  if (corpora.empty()) {
    return MissingApproachError(
        "no input corpus in campaign (no approach with exactly one trial)");
  }
  ResultTable table(campaign.Names(), corpora);
  for (size_t column = 0; column < corpora.size(); ++column) {
    auto reach = ReachFromCorpus(campaign, corpora[column], value_reducer,
                                 collection_reducer);
    CHECK(reach.ok()) << reach.status();  // Candidates have one trial.
    size_t row = 0;
    for (auto &[name, value] : *reach) {
      table.Set(row++, column, std::move(value));
    }
  }
  return table;
}

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_RELCOV_H_
