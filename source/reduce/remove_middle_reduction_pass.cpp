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

#include "source/reduce/remove_middle_reduction_pass.h"

#include <algorithm>
#include <utility>

namespace symtools {
namespace reduce {

namespace {
const size_t kLinearMaxSpan = 4;
}  // namespace

bool RemoveMiddleReductionPass::Gate(const std::string& testcase) const {
  return testcase.size() > 2;
}

bool RemoveMiddleReductionPass::TryRemove(const std::string& testcase,
                                          size_t pos1, size_t pos2,
                                          std::string* result) {
  const std::string prefix = testcase.substr(0, pos1);
  const std::string suffix = testcase.substr(pos2);
  std::string candidate = prefix + suffix;
  if (!TestReduction({prefix, testcase.substr(pos1, pos2 - pos1), suffix},
                     candidate)) {
    return false;
  }
  *result = std::move(candidate);
  return true;
}

std::string RemoveMiddleReductionPass::Run(const std::string& testcase) {
  std::string result;
  const size_t size = testcase.size();
  for (size_t pos1 = 0; pos1 + 1 < size; ++pos1) {
    if (variant_ == Variant::Linear) {
      const size_t last = std::min(size - 1, pos1 + kLinearMaxSpan);
      for (size_t pos2 = pos1 + 1; pos2 <= last; ++pos2) {
        if (TryRemove(testcase, pos1, pos2, &result)) {
          return result;
        }
      }
    } else {
      for (size_t pos2 = size - 1; pos2 > pos1; --pos2) {
        if (TryRemove(testcase, pos1, pos2, &result)) {
          return result;
        }
      }
    }
  }
  return testcase;
}

}  // namespace reduce
}  // namespace symtools
