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

#include "./reducer.h"

#include <cstddef>
#include <vector>

#include "gtest/gtest.h"
#include "./defs.h"
#include "./status_util.h"
#include "./test_util.h"

namespace diffcov {
namespace {

double Reduce(const std::vector<double> &values, ValueReducer reducer) {
  auto result = ReduceValues(values, reducer);
  CHECK(result.ok()) << result.status();
  return *result;
}

TEST(ReduceValues, Median) {
  EXPECT_DOUBLE_EQ(Reduce({3, 1, 2}, ValueReducer::kMedian), 2);
  EXPECT_DOUBLE_EQ(Reduce({5}, ValueReducer::kMedian), 5);
  // Even count: mean of the two middle values.
  EXPECT_DOUBLE_EQ(Reduce({4, 1, 3, 2}, ValueReducer::kMedian), 2.5);
  EXPECT_DOUBLE_EQ(Reduce({0.5, 1}, ValueReducer::kMedian), 0.75);
}

TEST(ReduceValues, MinMaxMean) {
  const std::vector<double> values = {0.25, 1, 0.5, 0.25};
  EXPECT_DOUBLE_EQ(Reduce(values, ValueReducer::kMin), 0.25);
  EXPECT_DOUBLE_EQ(Reduce(values, ValueReducer::kMax), 1);
  EXPECT_DOUBLE_EQ(Reduce(values, ValueReducer::kMean), 0.5);
}

TEST(ReduceValues, EmptyInputFails) {
  for (size_t i = 0; i < kNumValueReducers; ++i) {
    const auto reducer = static_cast<ValueReducer>(i);
    EXPECT_TRUE(IsEmptyInput(ReduceValues({}, reducer).status()))
        << ValueReducerName(reducer);
  }
}

TEST(ValueReducer, NamesAndParsing) {
  for (size_t i = 0; i < kNumValueReducers; ++i) {
    const auto reducer = static_cast<ValueReducer>(i);
    ValueReducer parsed = ValueReducer::kMedian;
    EXPECT_TRUE(ParseValueReducer(ValueReducerName(reducer), parsed));
    EXPECT_EQ(parsed, reducer);
  }
  ValueReducer parsed = ValueReducer::kMedian;
  EXPECT_TRUE(ParseValueReducer("MAX", parsed));
  EXPECT_EQ(parsed, ValueReducer::kMax);
  EXPECT_TRUE(ParseValueReducer("average", parsed));
  EXPECT_EQ(parsed, ValueReducer::kMean);
  EXPECT_FALSE(ParseValueReducer("mode", parsed));
  EXPECT_EQ(parsed, ValueReducer::kMean);
}

TEST(CollectionReducer, NamesAndParsing) {
  CollectionReducer parsed = CollectionReducer::kUnion;
  EXPECT_TRUE(ParseCollectionReducer("Intersection", parsed));
  EXPECT_EQ(parsed, CollectionReducer::kIntersection);
  EXPECT_TRUE(ParseCollectionReducer("union", parsed));
  EXPECT_EQ(parsed, CollectionReducer::kUnion);
  EXPECT_FALSE(ParseCollectionReducer("difference", parsed));
  EXPECT_EQ(CollectionReducerName(CollectionReducer::kIntersection),
            "intersection");
}

TEST(ReduceCollection, UnionAndIntersection) {
  const EdgeSet<int> a = {1, 2, 3};
  const EdgeSet<int> b = {2, 3, 4};
  const EdgeSet<int> c = {3, 5};
  const std::vector<const EdgeSet<int> *> sets = {&a, &b, &c};

  auto all = ReduceCollection<int>(sets, CollectionReducer::kUnion);
  ASSERT_OK(all);
  EXPECT_EQ(*all, EdgeSet<int>({1, 2, 3, 4, 5}));

  auto common = ReduceCollection<int>(sets, CollectionReducer::kIntersection);
  ASSERT_OK(common);
  EXPECT_EQ(*common, EdgeSet<int>({3}));
}

TEST(ReduceCollection, SingleSetIsItself) {
  const EdgeSet<int> a = {1, 2};
  const std::vector<const EdgeSet<int> *> sets = {&a};
  for (auto reducer :
       {CollectionReducer::kUnion, CollectionReducer::kIntersection}) {
    auto reduced = ReduceCollection<int>(sets, reducer);
    ASSERT_OK(reduced);
    EXPECT_EQ(*reduced, a);
  }
}

TEST(ReduceCollection, DisjointIntersectionIsEmpty) {
  const EdgeSet<int> a = {1};
  const EdgeSet<int> b = {2};
  const EdgeSet<int> empty;
  std::vector<const EdgeSet<int> *> sets = {&a, &b};
  auto common = ReduceCollection<int>(sets, CollectionReducer::kIntersection);
  ASSERT_OK(common);
  EXPECT_TRUE(common->empty());

  sets = {&a, &empty};
  auto all = ReduceCollection<int>(sets, CollectionReducer::kUnion);
  ASSERT_OK(all);
  EXPECT_EQ(*all, a);
}

TEST(ReduceCollection, EmptyInputFails) {
  const std::vector<const EdgeSet<int> *> none;
  EXPECT_TRUE(IsEmptyInput(
      ReduceCollection<int>(none, CollectionReducer::kUnion).status()));
  EXPECT_TRUE(IsEmptyInput(
      ReduceCollection<int>(none, CollectionReducer::kIntersection).status()));
}

}  // namespace
}  // namespace diffcov
