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

#ifndef THIRD_PARTY_DIFFCOV_DEFS_H_
#define THIRD_PARTY_DIFFCOV_DEFS_H_

// Only simple definitions here. Minimal code, no dependencies.

#include <cstdint>
#include <map>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

namespace diffcov {

// Name of an approach (fuzzer, seed corpus, test suite) under comparison.
using ApproachName = std::string;
// Identifies one trial (run) of an approach, unique within the approach.
using TrialId = std::string;
// Number of times an edge was hit in one trial, as reported by afl-showmap.
using HitCount = uint64_t;

// Edge ids as read from coverage files. The core is generic in the edge id;
// everything that touches files instantiates it with this type.
using FileEdgeId = std::string;

// A set of reached edges. Iteration order is unspecified.
template <typename EdgeId>
using EdgeSet = absl::flat_hash_set<EdgeId>;

// Raw per-trial coverage: edge id -> hit count.
template <typename EdgeId>
using HitCounts = absl::flat_hash_map<EdgeId, HitCount>;

// Raw campaign data, as produced by a reader or written as a literal:
// approach -> trial -> edge -> hit count.
// std::map because approach and trial order must be deterministic.
template <typename EdgeId>
using RawCampaign =
    std::map<ApproachName, std::map<TrialId, HitCounts<EdgeId>>>;

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_DEFS_H_
