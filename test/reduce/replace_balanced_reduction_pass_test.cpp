// Copyright (c) 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "source/reduce/replace_balanced_reduction_pass.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/reduce/reduce_test_util.h"

namespace symtools {
namespace reduce {
namespace {

using ::testing::ElementsAre;

bool IsNestedName(const std::string& candidate) {
  return StartsWith(candidate, "N") && EndsWith(candidate, "E");
}

TEST(ReplaceBalancedReductionPassTest, Gate) {
  FunctionOracle oracle([](const std::string&) { return true; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("replace balanced groups", pass.GetName());
  EXPECT_FALSE(pass.Gate(""));
  EXPECT_FALSE(pass.Gate("NE"));
  EXPECT_FALSE(pass.Gate("NaN"));
  EXPECT_FALSE(pass.Gate("abE"));
  EXPECT_TRUE(pass.Gate("NaE"));
  EXPECT_TRUE(pass.Gate("xIyE"));
  EXPECT_TRUE(pass.Gate("JE1"));
}

TEST(ReplaceBalancedReductionPassTest, ShortInputsAreReturnedUnchanged) {
  RecordingOracle oracle([](const std::string&) { return true; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("", pass.Run(""));
  EXPECT_EQ("a", pass.Run("a"));
  EXPECT_TRUE(oracle.GetQueries().empty());
}

TEST(ReplaceBalancedReductionPassTest, ReplacesContents) {
  RecordingOracle oracle(IsNestedName);
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("NiE", pass.Run("N12helloE"));
  EXPECT_THAT(oracle.GetQueries(), ElementsAre("1A", "NiE"));
}

TEST(ReplaceBalancedReductionPassTest, ReplacesWholeGroup) {
  FunctionOracle oracle([](const std::string&) { return true; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("x1A", pass.Run("xN3fooE"));
}

TEST(ReplaceBalancedReductionPassTest, OneReplacementPerRun) {
  FunctionOracle oracle([](const std::string&) { return true; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("1AN1bE", pass.Run("N1aEN1bE"));

  std::string result;
  EXPECT_TRUE(pass.ApplyToFixpoint("N1aEN1bE", &result));
  EXPECT_EQ("1A1A", result);
}

TEST(ReplaceBalancedReductionPassTest, DoesNotProposeSameContents) {
  RecordingOracle oracle([](const std::string&) { return false; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("NiE", pass.Run("NiE"));
  EXPECT_THAT(oracle.GetQueries(), ElementsAre("1A"));
}

TEST(ReplaceBalancedReductionPassTest, TriesLaterOpeners) {
  RecordingOracle oracle(
      [](const std::string& candidate) { return StartsWith(candidate, "NaE"); });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("NaE1A", pass.Run("NaEIbE"));
  EXPECT_THAT(oracle.GetQueries(),
              ElementsAre("1AIbE", "NiEIbE", "1A", "NiE", "NaE1A"));
}

TEST(ReplaceBalancedReductionPassTest, IgnoresOpenersAtTheEnd) {
  RecordingOracle oracle([](const std::string&) { return true; });
  ReplaceBalancedReductionPass pass(&oracle, true);
  EXPECT_EQ("aEN", pass.Run("aEN"));
  EXPECT_EQ("aENE", pass.Run("aENE"));
  EXPECT_EQ(0u, oracle.GetInvocationCount());
}

}  // namespace
}  // namespace reduce
}  // namespace symtools
