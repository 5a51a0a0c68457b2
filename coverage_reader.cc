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

#include "./coverage_reader.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>  // NOLINT
#include <map>
#include <string>
#include <system_error>  // NOLINT
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "./defs.h"
#include "./status_util.h"
#include "./util.h"

namespace diffcov {

namespace {

bool IsHidden(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

// Returns the non-hidden entries of `dir_path`, sorted by name.
absl::StatusOr<std::vector<std::filesystem::directory_entry>> ListDir(
    const std::filesystem::path &dir_path) {
  std::error_code error;
  std::filesystem::directory_iterator it(dir_path, error);
  if (error) {
    return absl::NotFoundError(
        absl::StrCat("Failed to list ", dir_path.string(), ": ",
                     error.message()));
  }
  std::vector<std::filesystem::directory_entry> entries;
  for (const auto &entry : it) {
    if (IsHidden(entry.path())) continue;
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

}  // namespace

absl::Status ParseShowmapText(absl::string_view text, absl::string_view source,
                              HitCounts<FileEdgeId> &hit_counts) {
  size_t line_number = 0;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    const std::vector<absl::string_view> fields = absl::StrSplit(line, ':');
    auto malformed = [&](absl::string_view what) {
      return MalformedCoverageRecordError(absl::StrCat(
          source, ":", line_number, ": ", what, ": '", line, "'"));
    };
    if (fields.size() != 2) {
      return malformed("expected <edge_id>:<count>");
    }
    const absl::string_view edge = absl::StripAsciiWhitespace(fields[0]);
    if (edge.empty()) return malformed("empty edge id");
    HitCount count = 0;
    if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(fields[1]), &count)) {
      return malformed("count is not a non-negative integer");
    }
    hit_counts.insert_or_assign(std::string(edge), count);
  }
  return absl::OkStatus();
}

absl::StatusOr<HitCounts<FileEdgeId>> ReadShowmapFile(
    absl::string_view file_path) {
  std::string text;
  DIFFCOV_RETURN_IF_ERROR(ReadFromLocalFile(file_path, text));
  HitCounts<FileEdgeId> hit_counts;
  DIFFCOV_RETURN_IF_ERROR(ParseShowmapText(text, file_path, hit_counts));
  return hit_counts;
}

absl::StatusOr<std::map<TrialId, HitCounts<FileEdgeId>>> ReadApproachDir(
    absl::string_view dir_path) {
  auto entries = ListDir(std::string(dir_path));
  if (!entries.ok()) return entries.status();
  std::map<TrialId, HitCounts<FileEdgeId>> trials;
  for (const auto &entry : *entries) {
    const std::string path = entry.path().string();
    if (!entry.is_regular_file()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Not a coverage file: ", path));
    }
    TrialId trial_id = FileStem(entry.path().filename().string());
    if (trials.count(trial_id) != 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Duplicate trial id '", trial_id, "' in ", dir_path, " (", path,
          ")"));
    }
    auto hit_counts = ReadShowmapFile(path);
    if (!hit_counts.ok()) return hit_counts.status();
    trials.emplace(std::move(trial_id), *std::move(hit_counts));
  }
  return trials;
}

absl::StatusOr<RawCampaign<FileEdgeId>> ReadCampaignDir(
    absl::string_view dir_path) {
  const std::filesystem::path root{std::string(dir_path)};
  std::error_code error;
  if (!std::filesystem::is_directory(root, error)) {
    return absl::NotFoundError(absl::StrCat("Not a directory: ", dir_path));
  }
  auto entries = ListDir(root);
  if (!entries.ok()) return entries.status();
  RawCampaign<FileEdgeId> campaign;
  for (const auto &entry : *entries) {
    if (!entry.is_directory()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Not an approach directory: ", entry.path().string()));
    }
    auto trials = ReadApproachDir(entry.path().string());
    if (!trials.ok()) return trials.status();
    campaign.emplace(entry.path().filename().string(), *std::move(trials));
  }
  return campaign;
}

}  // namespace diffcov
