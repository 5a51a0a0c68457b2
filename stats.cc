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

#include "./stats.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <ostream>
#include <vector>

#include "absl/types/span.h"
#include "./logging.h"

namespace diffcov {

namespace {
// Helper for PrintCampaignStats().
// Prints min/max/avg and the full sorted contents of `values`.
void PrintMinMaxAvg(std::vector<size_t> values, std::ostream &os) {
  CHECK(!values.empty());
  std::sort(values.begin(), values.end());
  os << "min:\t" << values.front() << "\t";
  os << "max:\t" << values.back() << "\t";
  os << "avg:\t"
     << (std::accumulate(values.begin(), values.end(), 0.) /
         static_cast<double>(values.size()))
     << "\t";
  os << "--";
  for (const auto value : values) {
    os << "\t" << value;
  }
}

}  // namespace

void PrintCampaignStats(absl::Span<const ApproachStats> stats_vec,
                        std::ostream &os) {
  size_t total_trials = 0;
  for (const auto &stats : stats_vec) total_trials += stats.num_trials;
  os << "Campaign: " << stats_vec.size() << " approaches, " << total_trials
     << " trials\n";
  for (const auto &stats : stats_vec) {
    os << stats.name << ": trials:\t" << stats.num_trials << "\t"
       << "with result:\t" << stats.num_trials_with_result << "\t"
       << "upper:\t" << stats.upper_bound_size << "\t"
       << "lower:\t" << stats.lower_bound_size << "\t"
       << "trial size ";
    PrintMinMaxAvg(stats.trial_sizes, os);
    os << "\n";
  }
}

}  // namespace diffcov
