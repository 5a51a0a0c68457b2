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

#ifndef THIRD_PARTY_DIFFCOV_APPROACH_FILTER_H_
#define THIRD_PARTY_DIFFCOV_APPROACH_FILTER_H_

#include <cstddef>
#include <regex>  // NOLINT
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./defs.h"
#include "./status_util.h"

namespace diffcov {

// Selects approaches by name.
//
// A name passes the filter if it contains a match of at least one include
// pattern (or there are no include patterns) and contains no match of any
// exclude pattern. Patterns are ECMAScript regular expressions; matching is a
// search, not a full match, so "fuzz" selects "my_fuzzer".
class ApproachFilter {
 public:
  // Compiles the patterns. Returns InvalidArgument on a bad pattern.
  static absl::StatusOr<ApproachFilter> Create(
      const std::vector<std::string> &include_patterns,
      const std::vector<std::string> &exclude_patterns);

  // Returns true if `name` passes the filter.
  bool Matches(const ApproachName &name) const;

  // True if the filter keeps every name.
  bool empty() const { return include_.empty() && exclude_.empty(); }

 private:
  ApproachFilter() = default;

  std::vector<std::regex> include_;
  std::vector<std::regex> exclude_;
};

// Removes from `campaign` every approach that does not pass `filter`.
// Returns an EmptyInput error if no approach is left.
template <typename EdgeId>
absl::Status ApplyApproachFilter(const ApproachFilter &filter,
                                 RawCampaign<EdgeId> &campaign) {
  const size_t num_before = campaign.size();
  for (auto it = campaign.begin(); it != campaign.end();) {
    if (filter.Matches(it->first)) {
      ++it;
    } else {
      it = campaign.erase(it);
    }
  }
  if (campaign.empty()) {
    return EmptyInputError(absl::StrCat("no approach left after filtering (",
                                        num_before, " before filtering)"));
  }
  return absl::OkStatus();
}

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_APPROACH_FILTER_H_
