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

#include "./diffcov_interface.h"

#include <cstddef>
#include <cstdlib>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "./approach_filter.h"
#include "./campaign.h"
#include "./coverage_reader.h"
#include "./defs.h"
#include "./environment.h"
#include "./logging.h"
#include "./output.h"
#include "./reducer.h"
#include "./relcov.h"
#include "./relscore.h"
#include "./result_table.h"
#include "./stats.h"
#include "./status_util.h"

namespace diffcov {

namespace {

using FileCampaign = Campaign<FileEdgeId>;

// Logs why each undefined entry of `scores` is undefined.
void LogUndefinedScores(const Environment &env, const Scores &scores) {
  if (env.log_level < 2) return;
  for (const auto &[name, score] : scores) {
    if (!score.ok()) LOG(INFO) << name << ": undefined: " << score.status();
  }
}

void LogUndefinedCells(const Environment &env, const ResultTable &table) {
  if (env.log_level < 2) return;
  for (size_t row = 0; row < table.num_rows(); ++row) {
    for (size_t column = 0; column < table.num_columns(); ++column) {
      const auto &value = table.Get(row, column);
      if (value.ok()) continue;
      LOG(INFO) << table.rows()[row] << " vs " << table.columns()[column]
                << ": undefined: " << value.status();
    }
  }
}

absl::Status EmitScores(const Environment &env, const RunConfig &config,
                        const Scores &scores, std::ostream &out) {
  LogUndefinedScores(env, scores);
  return PrintScores(scores, config.output, out);
}

absl::Status EmitTable(const Environment &env, const RunConfig &config,
                       const ResultTable &table, std::ostream &out) {
  LogUndefinedCells(env, table);
  return PrintTable(table, config.output, out);
}

absl::StatusOr<FileCampaign> LoadCampaign(const Environment &env,
                                          const RunConfig &config) {
  auto filter = ApproachFilter::Create(env.include_approach,
                                       env.exclude_approach);
  if (!filter.ok()) return filter.status();

  auto raw = ReadCampaignDir(config.campaign_dir);
  if (!raw.ok()) return raw.status();
  if (raw->empty()) {
    return EmptyInputError(
        absl::StrCat("no approach directories in ", config.campaign_dir));
  }
  if (!filter->empty()) {
    DIFFCOV_RETURN_IF_ERROR(ApplyApproachFilter(*filter, *raw));
    if (env.log_level > 0) {
      std::vector<std::string> kept;
      for (const auto &[name, trials] : *raw) kept.push_back(name);
      LOG(INFO) << "Approach filter: include: "
                << absl::StrJoin(env.include_approach, ",")
                << " exclude: " << absl::StrJoin(env.exclude_approach, ",")
                << " kept: " << absl::StrJoin(kept, ",");
    }
  }

  if (env.log_level >= 2) {
    for (const auto &[name, trials] : *raw) {
      for (const auto &[trial_id, hit_counts] : trials) {
        LOG(INFO) << VV(name) << VV(trial_id) << VV(hit_counts.size());
      }
    }
  }

  auto campaign = BuildCampaign(*raw);
  if (!campaign.ok()) return campaign.status();
  if (env.log_level > 0) {
    std::ostringstream os;
    PrintCampaignStats(CollectCampaignStats(*campaign), os);
    LOG(INFO) << config.campaign_dir << "\n" << os.str();
  }
  return campaign;
}

}  // namespace

absl::Status RunCommand(const Environment &env, const RunConfig &config,
                        std::ostream &out) {
  auto campaign = LoadCampaign(env, config);
  if (!campaign.ok()) return campaign.status();

  const ValueReducer vr = config.value_reducer;
  const CollectionReducer cr = config.collection_reducer;
  if (env.log_level > 0) {
    LOG(INFO) << "Running " << CommandName(config.command)
              << " value_reducer: " << ValueReducerName(vr)
              << " collection_reducer: " << CollectionReducerName(cr)
              << (env.reference.empty() ? "" : " reference: ")
              << env.reference;
  }

  switch (config.command) {
    case Command::kRelscore:
      return EmitScores(env, config, RelscoreAll(*campaign), out);
    case Command::kRelcov:
      return EmitTable(env, config,
                       RelcovTable(*campaign, vr, cr, env.num_threads), out);
    case Command::kRelcovReliability:
      return EmitScores(env, config, Reliability(*campaign, vr), out);
    case Command::kRelcovPerformanceFuzzer: {
      if (env.reference.empty()) {
        return EmitTable(env, config,
                         RelcovTable(*campaign, vr, cr, env.num_threads), out);
      }
      auto scores = PerformanceOverApproach(*campaign, env.reference, vr, cr);
      if (!scores.ok()) return scores.status();
      return EmitScores(env, config, *scores, out);
    }
    case Command::kRelcovPerformanceCorpus: {
      if (env.reference.empty()) {
        auto table = ReachTable(*campaign, vr, cr);
        if (!table.ok()) return table.status();
        return EmitTable(env, config, *table, out);
      }
      auto scores = ReachFromCorpus(*campaign, env.reference, vr, cr);
      if (!scores.ok()) return scores.status();
      return EmitScores(env, config, *scores, out);
    }
  }
  return absl::InternalError("unhandled command");
}

int DiffcovMain(const Environment &env, std::ostream &out) {
  auto config = env.Resolve();
  if (!config.ok()) {
    LOG(ERROR) << "Usage: " << env.exec_name
               << " [flags] <command> <campaign_dir>: " << config.status();
    return EXIT_FAILURE;
  }
  const absl::Status status = RunCommand(env, *config, out);
  if (!status.ok()) {
    LOG(ERROR) << CommandName(config->command) << " failed: " << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

}  // namespace diffcov
