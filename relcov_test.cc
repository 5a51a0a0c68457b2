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

#include "./relcov.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "./campaign.h"
#include "./defs.h"
#include "./reducer.h"
#include "./result_table.h"
#include "./status_util.h"
#include "./test_util.h"

namespace diffcov {
namespace {

constexpr auto kMedian = ValueReducer::kMedian;
constexpr auto kUnion = CollectionReducer::kUnion;

Campaign<int> SampleCampaign(bool with_seeds = true) {
  auto campaign = BuildCampaign(SampleRawCampaign(with_seeds));
  CHECK(campaign.ok()) << campaign.status();
  return *std::move(campaign);
}

// Returns the defined value of `scores[name]`, or dies.
double ValueOf(const Scores &scores, const ApproachName &name) {
  auto it = scores.find(name);
  CHECK(it != scores.end()) << name;
  CHECK(it->second.ok()) << name << ": " << it->second.status();
  return *it->second;
}

TEST(Relcov, RelcovAgainstByName) {
  const auto campaign = SampleCampaign();
  auto relcov =
      RelcovAgainst(campaign, "fuzzer_a", "fuzzer_c", kMedian, kUnion);
  ASSERT_OK(relcov);
  EXPECT_DOUBLE_EQ(*relcov, 2.0 / 3);

  EXPECT_TRUE(IsMissingApproach(
      RelcovAgainst(campaign, "fuzzer_x", "fuzzer_c", kMedian, kUnion)
          .status()));
  EXPECT_TRUE(IsMissingApproach(
      RelcovAgainst(campaign, "fuzzer_a", "fuzzer_x", kMedian, kUnion)
          .status()));
}

TEST(Relcov, Reliability) {
  const Scores scores = Reliability(SampleCampaign(), kMedian);
  EXPECT_EQ(scores.size(), 4);
  EXPECT_DOUBLE_EQ(ValueOf(scores, "fuzzer_a"), 2.0 / 3);
  EXPECT_DOUBLE_EQ(ValueOf(scores, "fuzzer_b"), 1.0);
  EXPECT_DOUBLE_EQ(ValueOf(scores, "fuzzer_c"), 1.0);
  EXPECT_DOUBLE_EQ(ValueOf(scores, "seeds"), 1.0);
}

TEST(Relcov, ReliabilityOfApproachWithoutCoverageIsUndefined) {
  RawCampaign<int> raw = SampleRawCampaign();
  raw["crashed"]["t1"];
  auto campaign = BuildCampaign(raw);
  ASSERT_OK(campaign);
  const Scores scores = Reliability(*campaign, kMedian);
  EXPECT_TRUE(IsDivisionUndefined(scores.at("crashed").status()));
  EXPECT_DOUBLE_EQ(ValueOf(scores, "fuzzer_b"), 1.0);
}

TEST(Relcov, PerformanceOverApproach) {
  auto scores =
      PerformanceOverApproach(SampleCampaign(), "fuzzer_c", kMedian, kUnion);
  ASSERT_OK(scores);
  EXPECT_EQ(scores->count("fuzzer_c"), 0);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "fuzzer_a"), 2.0 / 3);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "fuzzer_b"), 2.0 / 3);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "seeds"), 1.0 / 3);

  EXPECT_TRUE(IsMissingApproach(
      PerformanceOverApproach(SampleCampaign(), "fuzzer_x", kMedian, kUnion)
          .status()));
}

TEST(Relcov, CorpusCandidates) {
  EXPECT_EQ(CorpusCandidates(SampleCampaign()),
            std::vector<ApproachName>({"seeds"}));
  EXPECT_TRUE(CorpusCandidates(SampleCampaign(/*with_seeds=*/false)).empty());
}

TEST(Relcov, ReachFromCorpus) {
  auto scores = ReachFromCorpus(SampleCampaign(), "seeds", kMedian, kUnion);
  ASSERT_OK(scores);
  EXPECT_EQ(scores->size(), 4);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "fuzzer_a"), 1.0 / 3);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "fuzzer_b"), 0.5);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "fuzzer_c"), 1.0 / 3);
  EXPECT_DOUBLE_EQ(ValueOf(*scores, "seeds"), 1.0);
}

TEST(Relcov, ReachFromCorpusNeedsSingleTrialCorpus) {
  EXPECT_TRUE(IsMissingApproach(
      ReachFromCorpus(SampleCampaign(), "fuzzer_x", kMedian, kUnion)
          .status()));
  // fuzzer_a has two trials, so it can't be an input corpus.
  EXPECT_TRUE(IsMissingApproach(
      ReachFromCorpus(SampleCampaign(), "fuzzer_a", kMedian, kUnion)
          .status()));
}

TEST(Relcov, ReachTable) {
  auto table = ReachTable(SampleCampaign(), kMedian, kUnion);
  ASSERT_OK(table);
  EXPECT_EQ(table->rows(), std::vector<ApproachName>(
                               {"fuzzer_a", "fuzzer_b", "fuzzer_c", "seeds"}));
  EXPECT_EQ(table->columns(), std::vector<ApproachName>({"seeds"}));
  auto cell = table->Get("fuzzer_b", "seeds");
  ASSERT_OK(cell);
  EXPECT_DOUBLE_EQ(*cell, 0.5);
  cell = table->Get("seeds", "seeds");
  ASSERT_OK(cell);
  EXPECT_DOUBLE_EQ(*cell, 1.0);

  EXPECT_TRUE(IsMissingApproach(
      ReachTable(SampleCampaign(/*with_seeds=*/false), kMedian, kUnion)
          .status()));
}

TEST(Relcov, RelcovTable) {
  const ResultTable table =
      RelcovTable(SampleCampaign(/*with_seeds=*/false), kMedian, kUnion);
  ASSERT_EQ(table.num_rows(), 3);
  ASSERT_EQ(table.num_columns(), 3);
  // Rows: the approach; columns: the reference.
  const std::vector<std::vector<double>> expected = {
      {2.0 / 3, 0.75, 2.0 / 3},
      {2.0 / 3, 1.0, 2.0 / 3},
      {1.0, 1.0, 1.0},
  };
  for (size_t row = 0; row < 3; ++row) {
    for (size_t column = 0; column < 3; ++column) {
      const auto &cell = table.Get(row, column);
      ASSERT_OK(cell);
      EXPECT_DOUBLE_EQ(*cell, expected[row][column])
          << table.rows()[row] << " vs " << table.columns()[column];
    }
  }
}

TEST(Relcov, RelcovTableIsTheSameWithThreads) {
  const auto campaign = SampleCampaign();
  const ResultTable one = RelcovTable(campaign, kMedian, kUnion, 1);
  for (size_t num_threads : {2, 3, 4, 100}) {
    const ResultTable many =
        RelcovTable(campaign, kMedian, kUnion, num_threads);
    ASSERT_EQ(many.num_rows(), one.num_rows());
    for (size_t row = 0; row < one.num_rows(); ++row) {
      for (size_t column = 0; column < one.num_columns(); ++column) {
        ASSERT_OK(many.Get(row, column));
        EXPECT_EQ(*many.Get(row, column), *one.Get(row, column));
      }
    }
  }
}

TEST(Relcov, RelcovTableKeepsUndefinedCells) {
  RawCampaign<int> raw = SampleRawCampaign(/*with_seeds=*/false);
  raw["crashed"]["t1"];
  auto campaign = BuildCampaign(raw);
  ASSERT_OK(campaign);
  const ResultTable table = RelcovTable(*campaign, kMedian, kUnion);
  // Nothing can be measured against an approach without coverage...
  for (const auto &row : table.rows()) {
    EXPECT_TRUE(IsDivisionUndefined(table.Get(row, "crashed").status()))
        << row;
  }
  // ... but its own relcov against the others is 0.
  auto cell = table.Get("crashed", "fuzzer_a");
  ASSERT_OK(cell);
  EXPECT_DOUBLE_EQ(*cell, 0.0);
  EXPECT_OK(table.Get("fuzzer_a", "fuzzer_b"));
}

}  // namespace
}  // namespace diffcov
