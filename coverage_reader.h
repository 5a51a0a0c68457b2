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

// Reads afl-showmap coverage files and campaign directories.
//
// A coverage file has one `<edge_id>:<count>` record per line, as written by
// `afl-showmap`. A campaign directory has one subdirectory per approach; every
// file in an approach directory is one trial, named after the file:
//
//   campaign/
//     fuzzer_a/
//       t1        <- trial "t1" of approach "fuzzer_a"
//       t2.cov    <- trial "t2"
//     seeds/
//       seeds     <- a single-trial input corpus
//
// Entries whose name starts with '.' are skipped.

#ifndef THIRD_PARTY_DIFFCOV_COVERAGE_READER_H_
#define THIRD_PARTY_DIFFCOV_COVERAGE_READER_H_

#include <map>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "./defs.h"

namespace diffcov {

// Parses the afl-showmap records in `text` into `hit_counts`.
// `source` names the text in error messages (usually the file path).
// Blank lines and surrounding whitespace are ignored. A later record for the
// same edge replaces an earlier one.
// Returns a MalformedCoverageRecord error on a line that is not exactly
// `<edge_id>:<count>` with a non-empty edge id and a non-negative integer
// count; `hit_counts` is unspecified in that case.
absl::Status ParseShowmapText(absl::string_view text, absl::string_view source,
                              HitCounts<FileEdgeId> &hit_counts);

// Reads one afl-showmap file.
absl::StatusOr<HitCounts<FileEdgeId>> ReadShowmapFile(
    absl::string_view file_path);

// Reads all trials of one approach directory: trial id => hit counts.
// Fails if the directory contains anything but regular files, or if two files
// map to the same trial id.
absl::StatusOr<std::map<TrialId, HitCounts<FileEdgeId>>> ReadApproachDir(
    absl::string_view dir_path);

// Reads a whole campaign directory: approach => trial => hit counts.
// Fails with NotFound if `dir_path` is not a directory, and with
// InvalidArgument if it contains anything but directories.
absl::StatusOr<RawCampaign<FileEdgeId>> ReadCampaignDir(
    absl::string_view dir_path);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_COVERAGE_READER_H_
