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

#include "source/reduce/remove_head_reduction_pass.h"

namespace symtools {
namespace reduce {

bool RemoveHeadReductionPass::Gate(const std::string& testcase) const {
  return testcase.size() > 1;
}

std::string RemoveHeadReductionPass::Run(const std::string& testcase) {
  if (testcase.size() < 2) {
    return testcase;
  }
  for (size_t pos = testcase.size() - 1; pos > 0; --pos) {
    std::string candidate = testcase.substr(pos);
    if (TestReduction({testcase.substr(0, pos), candidate}, candidate)) {
      return candidate;
    }
  }
  return testcase;
}

}  // namespace reduce
}  // namespace symtools
