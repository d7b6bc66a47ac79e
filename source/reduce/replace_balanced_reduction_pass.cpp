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

namespace symtools {
namespace reduce {

namespace {
const char kGroupOpeners[] = "JIN";
const char kGroupCloser = 'E';
const char kGroupReplacement[] = "1A";
const char kContentsReplacement[] = "iE";

bool IsGroupOpener(char c) { return c == 'J' || c == 'I' || c == 'N'; }
}  // namespace

bool ReplaceBalancedReductionPass::Gate(const std::string& testcase) const {
  return testcase.size() > 2 &&
         testcase.find(kGroupCloser) != std::string::npos &&
         testcase.find_first_of(kGroupOpeners) != std::string::npos;
}

std::string ReplaceBalancedReductionPass::Run(const std::string& testcase) {
  // Openers before |cursor| have been passed over.
  size_t cursor = 0;
  for (;;) {
    // An opener in the last two characters cannot enclose anything.
    size_t pos1 = cursor;
    while (pos1 + 2 < testcase.size() && !IsGroupOpener(testcase[pos1])) {
      ++pos1;
    }
    if (pos1 + 2 >= testcase.size()) {
      break;
    }

    const std::string prefix = testcase.substr(0, pos1);
    for (size_t pos2 = pos1 + 1; pos2 < testcase.size(); ++pos2) {
      if (testcase[pos2] != kGroupCloser) {
        continue;
      }
      const std::string suffix = testcase.substr(pos2 + 1);

      const std::string group = testcase.substr(pos1, pos2 + 1 - pos1);
      std::string candidate = prefix + kGroupReplacement + suffix;
      if (TestReduction({prefix, group, suffix}, candidate)) {
        return candidate;
      }

      if (pos2 - pos1 >= 2) {
        const std::string kept = testcase.substr(0, pos1 + 1);
        const std::string contents = testcase.substr(pos1 + 1, pos2 - pos1);
        if (contents == kContentsReplacement) {
          // Already as small as this replacement makes it.
          continue;
        }
        candidate = kept + kContentsReplacement + suffix;
        if (TestReduction({kept, contents, suffix}, candidate)) {
          return candidate;
        }
      }
    }
    cursor = pos1 + 1;
  }
  return testcase;
}

}  // namespace reduce
}  // namespace symtools
