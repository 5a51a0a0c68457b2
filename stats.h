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

#ifndef THIRD_PARTY_DIFFCOV_STATS_H_
#define THIRD_PARTY_DIFFCOV_STATS_H_

#include <cstddef>
#include <ostream>
#include <utility>
#include <vector>

#include "absl/types/span.h"
#include "./campaign.h"
#include "./defs.h"

namespace diffcov {

// Coverage summary of one approach.
struct ApproachStats {
  ApproachName name;
  size_t num_trials = 0;
  size_t num_trials_with_result = 0;
  size_t upper_bound_size = 0;  // Edges reached by at least one trial.
  size_t lower_bound_size = 0;  // Edges reached by every trial.
  std::vector<size_t> trial_sizes;  // Edges per trial, in trial id order.
};

// Returns the summary of every approach of `campaign`, in name order.
template <typename EdgeId>
std::vector<ApproachStats> CollectCampaignStats(
    const Campaign<EdgeId> &campaign) {
  std::vector<ApproachStats> stats_vec;
  stats_vec.reserve(campaign.size());
  for (const auto &[name, approach] : campaign.approaches()) {
    ApproachStats stats;
    stats.name = name;
    stats.num_trials = approach.num_trials();
    stats.num_trials_with_result = approach.NumTrialsWithResult();
    stats.upper_bound_size = approach.UpperBound().size();
    stats.lower_bound_size = approach.LowerBound().size();
    for (const auto &[trial_id, coverage] : approach.trials()) {
      stats.trial_sizes.push_back(coverage.size());
    }
    stats_vec.push_back(std::move(stats));
  }
  return stats_vec;
}

// Prints `stats_vec` to `os`, one line per approach, with min/max/avg of
// the trial sizes.
void PrintCampaignStats(absl::Span<const ApproachStats> stats_vec,
                        std::ostream &os);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_STATS_H_
