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

#include "source/reduce/replace_substitution_reduction_pass.h"

#include <cstdint>

#include "source/reduce/reduction_util.h"

namespace symtools {
namespace reduce {

namespace {
const char kSubstitutionStart = 'S';
const char kSubstitutionEnd = '_';
const size_t kMaxIndexDigits = 2;
}  // namespace

bool ReplaceSubstitutionReductionPass::FindSubstitution(
    const std::string& testcase, size_t from, size_t* begin, size_t* end) {
  for (size_t pos = from; pos < testcase.size(); ++pos) {
    if (testcase[pos] != kSubstitutionStart) {
      continue;
    }
    size_t digits = 0;
    while (digits < kMaxIndexDigits && pos + 1 + digits < testcase.size() &&
           IsSubstitutionDigit(testcase[pos + 1 + digits])) {
      ++digits;
    }
    const size_t terminator = pos + 1 + digits;
    if (digits > 0 && terminator < testcase.size() &&
        testcase[terminator] == kSubstitutionEnd) {
      *begin = pos;
      *end = terminator + 1;
      return true;
    }
  }
  return false;
}

bool ReplaceSubstitutionReductionPass::Gate(const std::string& testcase) const {
  size_t begin;
  size_t end;
  return FindSubstitution(testcase, 0, &begin, &end);
}

std::string ReplaceSubstitutionReductionPass::Run(const std::string& testcase) {
  size_t cursor = 0;
  size_t begin;
  size_t end;
  while (FindSubstitution(testcase, cursor, &begin, &end)) {
    const std::string kept = testcase.substr(0, begin + 1);
    const std::string digits = testcase.substr(begin + 1, end - begin - 2);
    const std::string suffix = testcase.substr(end);
    const uint32_t index = DecodeSubstitutionIndex(digits);
    for (uint32_t i = 0; i < index; i = (i == 0) ? 1 : i * 2) {
      const std::string candidate =
          kept + EncodeSubstitutionIndex(i) + kSubstitutionEnd + suffix;
      if (TestReduction({kept, digits, kSubstitutionEnd + suffix},
                        candidate)) {
        return candidate;
      }
    }
    cursor = end;
  }
  return testcase;
}

}  // namespace reduce
}  // namespace symtools
