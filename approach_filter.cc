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

#include "./approach_filter.h"

#include <regex>  // NOLINT
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./defs.h"
#include "./status_util.h"

namespace diffcov {

namespace {

absl::Status CompilePatterns(const std::vector<std::string> &patterns,
                             std::vector<std::regex> &compiled) {
  compiled.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    try {
      compiled.emplace_back(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &e) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid approach pattern '", pattern, "': ", e.what()));
    }
  }
  return absl::OkStatus();
}

bool SearchAny(const std::vector<std::regex> &regexes,
               const ApproachName &name) {
  for (const auto &regex : regexes) {
    if (std::regex_search(name, regex)) return true;
  }
  return false;
}

}  // namespace

absl::StatusOr<ApproachFilter> ApproachFilter::Create(
    const std::vector<std::string> &include_patterns,
    const std::vector<std::string> &exclude_patterns) {
  ApproachFilter filter;
  DIFFCOV_RETURN_IF_ERROR(CompilePatterns(include_patterns, filter.include_));
  DIFFCOV_RETURN_IF_ERROR(CompilePatterns(exclude_patterns, filter.exclude_));
  return filter;
}

bool ApproachFilter::Matches(const ApproachName &name) const {
  if (!include_.empty() && !SearchAny(include_, name)) return false;
  return !SearchAny(exclude_, name);
}

}  // namespace diffcov
