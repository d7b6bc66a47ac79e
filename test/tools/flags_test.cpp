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


#include "tools/util/flags.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class FlagTest : public ::testing::Test {
 protected:
  void SetUp() override { flags::FlagList::reset(); }
  void TearDown() override { flags::FlagList::reset(); }
};

TEST_F(FlagTest, NoArguments) {
  const char* argv[] = {"symtools-reduce", nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_THAT(flags::positional_arguments, IsEmpty());
}

TEST_F(FlagTest, PositionalArguments) {
  const char* argv[] = {"symtools-reduce-batch", "4", "-", "2", nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_THAT(flags::positional_arguments, ElementsAre("4", "-", "2"));
}

TEST_F(FlagTest, DoubleDashEndsFlags) {
  flags::Flag<bool> slow(false);
  flags::FlagRegistration slow_registration(slow, "--slow", "", false, false);

  const char* argv[] = {"symtools-reduce", "--", "--slow", nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_FALSE(slow.value());
  EXPECT_THAT(flags::positional_arguments, ElementsAre("--slow"));
}

TEST_F(FlagTest, BooleanFlags) {
  flags::Flag<bool> h(false);
  flags::FlagRegistration h_registration(h, "-h", "", false, true);
  flags::Flag<bool> slow(false);
  flags::FlagRegistration slow_registration(slow, "--slow", "", false, false);
  flags::Flag<bool> quiet(true);
  flags::FlagRegistration quiet_registration(quiet, "--quiet", "", false,
                                             false);

  const char* argv[] = {"symtools-reduce", "-h", "--slow", "--quiet=false",
                        nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_TRUE(h.value());
  EXPECT_TRUE(slow.value());
  EXPECT_FALSE(quiet.value());
}

TEST_F(FlagTest, BooleanFlagRejectsOtherLiterals) {
  flags::Flag<bool> slow(false);
  flags::FlagRegistration slow_registration(slow, "--slow", "", false, false);

  const char* argv[] = {"symtools-reduce", "--slow=TRUE", nullptr};
  EXPECT_FALSE(flags::Parse(argv));
}

TEST_F(FlagTest, StringFlags) {
  flags::Flag<std::string> f("");
  flags::FlagRegistration f_registration(f, "-f", "", false, true);
  flags::Flag<std::string> target("c++filt");
  flags::FlagRegistration target_registration(target, "--target", "", false,
                                              false);

  const char* argv[] = {"symtools-reduce", "-f", "-crash.txt",
                        "--target=llvm-cxxfilt -n", nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_EQ("-crash.txt", f.value());
  EXPECT_EQ("llvm-cxxfilt -n", target.value());
}

TEST_F(FlagTest, StringFlagNeedsValue) {
  flags::Flag<std::string> f("");
  flags::FlagRegistration f_registration(f, "-f", "", false, true);

  const char* argv[] = {"symtools-reduce", "-f", nullptr};
  EXPECT_FALSE(flags::Parse(argv));
}

TEST_F(FlagTest, UintFlags) {
  flags::Flag<uint32_t> cpu_limit(1);
  flags::FlagRegistration cpu_registration(cpu_limit, "--cpu-limit", "", false,
                                           false);
  flags::Flag<uint32_t> wall_limit(10000);
  flags::FlagRegistration wall_registration(wall_limit, "--wall-limit", "",
                                            false, false);

  const char* argv[] = {"symtools-reduce", "--cpu-limit", "0",
                        "--wall-limit=4294967295", nullptr};
  EXPECT_TRUE(flags::Parse(argv));
  EXPECT_EQ(0u, cpu_limit.value());
  EXPECT_EQ(4294967295u, wall_limit.value());
}

TEST_F(FlagTest, UintFlagRejectsInvalidNumbers) {
  flags::Flag<uint32_t> cpu_limit(1);
  flags::FlagRegistration cpu_registration(cpu_limit, "--cpu-limit", "", false,
                                           false);

  for (const char* value :
       {"--cpu-limit=-1", "--cpu-limit=1s", "--cpu-limit=",
        "--cpu-limit=4294967296"}) {
    const char* argv[] = {"symtools-reduce", value, nullptr};
    EXPECT_FALSE(flags::Parse(argv)) << value;
  }
}

TEST_F(FlagTest, UnknownFlag) {
  const char* argv[] = {"symtools-reduce", "--fast", nullptr};
  EXPECT_FALSE(flags::Parse(argv));
}

TEST_F(FlagTest, RepeatedFlag) {
  flags::Flag<bool> slow(false);
  flags::FlagRegistration slow_registration(slow, "--slow", "", false, false);

  const char* argv[] = {"symtools-reduce", "--slow", "--slow", nullptr};
  EXPECT_FALSE(flags::Parse(argv));
}

TEST_F(FlagTest, MissingRequiredFlag) {
  flags::Flag<std::string> input("");
  flags::FlagRegistration input_registration(input, "--input", "", true,
                                             false);

  const char* argv[] = {"symtools-reduce-batch", "1", "1", nullptr};
  EXPECT_FALSE(flags::Parse(argv));
}

}  // namespace
