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

#ifndef THIRD_PARTY_DIFFCOV_CAMPAIGN_H_
#define THIRD_PARTY_DIFFCOV_CAMPAIGN_H_

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./approach_data.h"
#include "./defs.h"
#include "./status_util.h"

namespace diffcov {

// All approaches of one evaluation campaign, by name.
//
// This is the input to every computation. It is built once and never
// modified afterwards, so any number of computations (and threads) may read
// the same Campaign concurrently.
template <typename EdgeId>
class Campaign {
 public:
  using Approaches = std::map<ApproachName, ApproachData<EdgeId>>;

  // Movable, not copyable.
  Campaign(Campaign &&) = default;
  Campaign &operator=(Campaign &&) = default;
  Campaign(const Campaign &) = delete;
  Campaign &operator=(const Campaign &) = delete;

  // Builds a campaign from raw hit counts.
  // Returns an EmptyInput error if `raw` has no approaches or some approach
  // has no trials.
  static absl::StatusOr<Campaign> Build(const RawCampaign<EdgeId> &raw) {
    Approaches approaches;
    for (const auto &[name, trials] : raw) {
      auto approach = ApproachData<EdgeId>::FromHitCounts(name, trials);
      if (!approach.ok()) return approach.status();
      approaches.emplace(name, *std::move(approach));
    }
    return FromApproaches(std::move(approaches));
  }

  // Same as above, from already constructed approaches.
  static absl::StatusOr<Campaign> FromApproaches(Approaches approaches) {
    if (approaches.empty()) {
      return EmptyInputError("campaign has no approaches");
    }
    return Campaign(std::move(approaches));
  }

  const Approaches &approaches() const { return approaches_; }
  size_t size() const { return approaches_.size(); }
  bool Contains(const ApproachName &name) const {
    return approaches_.count(name) != 0;
  }

  // Approach names in lexicographic order.
  std::vector<ApproachName> Names() const {
    std::vector<ApproachName> names;
    names.reserve(approaches_.size());
    for (const auto &[name, approach] : approaches_) names.push_back(name);
    return names;
  }

  // Returns the approach `name`, or a MissingApproach error.
  // The pointer is valid as long as `this` is.
  absl::StatusOr<const ApproachData<EdgeId> *> Get(
      const ApproachName &name) const {
    auto it = approaches_.find(name);
    if (it == approaches_.end()) {
      return MissingApproachError(absl::StrCat(
          "approach '", name,
          "' not found in campaign (it may have been filtered out)"));
    }
    return &it->second;
  }

  // Union of the edges reached by any trial of any approach.
  EdgeSet<EdgeId> AllEdges() const {
    EdgeSet<EdgeId> edges;
    for (const auto &[name, approach] : approaches_) {
      for (const auto &[trial_id, coverage] : approach.trials()) {
        edges.insert(coverage.edges().begin(), coverage.edges().end());
      }
    }
    return edges;
  }

 private:
  explicit Campaign(Approaches approaches)
      : approaches_(std::move(approaches)) {}

  Approaches approaches_;
};

// Free-function form of Campaign::Build().
template <typename EdgeId>
absl::StatusOr<Campaign<EdgeId>> BuildCampaign(const RawCampaign<EdgeId> &raw) {
  return Campaign<EdgeId>::Build(raw);
}

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_CAMPAIGN_H_
