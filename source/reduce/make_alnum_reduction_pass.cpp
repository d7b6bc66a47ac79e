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

#include "source/reduce/make_alnum_reduction_pass.h"

#include <algorithm>
#include <utility>

#include "source/reduce/reduction_util.h"

namespace symtools {
namespace reduce {

namespace {
// 'q' does not occur anywhere in the mangling grammar, so it is the least
// likely replacement to change how the rest of the testcase is parsed.
const char kReplacements[] = {'q', '0', '_'};
}  // namespace

bool MakeAlnumReductionPass::Gate(const std::string& testcase) const {
  return std::any_of(testcase.begin(), testcase.end(),
                     [](char c) { return !IsIdentifierChar(c); });
}

std::string MakeAlnumReductionPass::Run(const std::string& testcase) {
  std::string current = testcase;
  for (size_t pos = 0; pos < testcase.size(); ++pos) {
    if (IsIdentifierChar(testcase[pos])) {
      continue;
    }
    for (char replacement : kReplacements) {
      std::string candidate = current;
      candidate[pos] = replacement;
      if (TestReduction({current}, candidate)) {
        current = std::move(candidate);
        break;
      }
    }
  }
  return current;
}

}  // namespace reduce
}  // namespace symtools
