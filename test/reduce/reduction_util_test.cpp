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

#include "source/reduce/reduction_util.h"

#include <cstdint>
#include <string>

#include "gtest/gtest.h"

namespace symtools {
namespace reduce {
namespace {

TEST(ReductionUtilTest, IdentifierCharacters) {
  for (char c : std::string("azAZ09_")) {
    EXPECT_TRUE(IsIdentifierChar(c)) << c;
  }
  for (char c : std::string("$. -\n\x7f")) {
    EXPECT_FALSE(IsIdentifierChar(c)) << c;
  }
  EXPECT_FALSE(IsIdentifierChar(static_cast<char>(0xc3)));
}

TEST(ReductionUtilTest, SubstitutionDigits) {
  EXPECT_TRUE(IsSubstitutionDigit('0'));
  EXPECT_TRUE(IsSubstitutionDigit('9'));
  EXPECT_TRUE(IsSubstitutionDigit('A'));
  EXPECT_TRUE(IsSubstitutionDigit('Z'));
  EXPECT_FALSE(IsSubstitutionDigit('a'));
  EXPECT_FALSE(IsSubstitutionDigit('_'));
}

TEST(ReductionUtilTest, EscapeKeepsIdentifierCharacters) {
  EXPECT_EQ("", EscapeString(""));
  EXPECT_EQ("_Z3fooi", EscapeString("_Z3fooi"));
}

TEST(ReductionUtilTest, EscapeUsesLowercaseHex) {
  EXPECT_EQ("ab\\x24c", EscapeString("ab$c"));
  EXPECT_EQ("\\x0a", EscapeString("\n"));
  EXPECT_EQ("\\x20\\x2e", EscapeString(" ."));
  EXPECT_EQ("\\xff", EscapeString(std::string(1, static_cast<char>(0xff))));
  EXPECT_EQ("\\x00", EscapeString(std::string(1, '\0')));
}

TEST(ReductionUtilTest, EncodeSubstitutionIndex) {
  EXPECT_EQ("", EncodeSubstitutionIndex(0));
  EXPECT_EQ("0", EncodeSubstitutionIndex(1));
  EXPECT_EQ("9", EncodeSubstitutionIndex(10));
  EXPECT_EQ("A", EncodeSubstitutionIndex(11));
  EXPECT_EQ("Z", EncodeSubstitutionIndex(36));
  EXPECT_EQ("10", EncodeSubstitutionIndex(37));
  EXPECT_EQ("ZZ", EncodeSubstitutionIndex(36 * 36));
  EXPECT_EQ("100", EncodeSubstitutionIndex(36 * 36 + 1));
}

TEST(ReductionUtilTest, DecodeSubstitutionIndex) {
  EXPECT_EQ(0u, DecodeSubstitutionIndex(""));
  EXPECT_EQ(1u, DecodeSubstitutionIndex("0"));
  EXPECT_EQ(4u, DecodeSubstitutionIndex("3"));
  EXPECT_EQ(11u, DecodeSubstitutionIndex("A"));
  EXPECT_EQ(37u, DecodeSubstitutionIndex("10"));
  EXPECT_EQ(1296u, DecodeSubstitutionIndex("ZZ"));
}

TEST(ReductionUtilTest, SubstitutionIndexRoundTrip) {
  for (uint32_t value = 0; value <= 2000; ++value) {
    const std::string encoded = EncodeSubstitutionIndex(value);
    for (char c : encoded) {
      ASSERT_TRUE(IsSubstitutionDigit(c)) << value;
    }
    ASSERT_EQ(value, DecodeSubstitutionIndex(encoded)) << encoded;
  }
}

}  // namespace
}  // namespace reduce
}  // namespace symtools
