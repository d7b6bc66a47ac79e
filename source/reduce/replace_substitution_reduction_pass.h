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

#ifndef SOURCE_REDUCE_REPLACE_SUBSTITUTION_REDUCTION_PASS_H_
#define SOURCE_REDUCE_REPLACE_SUBSTITUTION_REDUCTION_PASS_H_

#include <cstddef>

#include "source/reduce/reduction_pass.h"

namespace symtools {
namespace reduce {

// A reduction pass that lowers the index of back-references "S<seq-id>_",
// where <seq-id> is one or two characters of [0-9A-Z].  The smaller indices
// 0, 1, 2, 4, 8, ... below the current one are tried in turn and the first one
// the oracle accepts is kept.  The doubling search is not exhaustive: an index
// between two tried ones is skipped.
//
// At most one back-reference is rewritten per run, so the pass is meant to be
// applied to a fixpoint.
class ReplaceSubstitutionReductionPass : public ReductionPass {
 public:
  ReplaceSubstitutionReductionPass(Oracle* oracle, bool quiet)
      : ReductionPass("replace substitutions", oracle, quiet) {}

  ~ReplaceSubstitutionReductionPass() override = default;

  bool Gate(const std::string& testcase) const final;

  std::string Run(const std::string& testcase) final;

  // Finds the first back-reference of |testcase| at or after |from|.  Returns
  // false if there is none; otherwise stores in |begin| the position of its
  // 'S' and in |end| the position just past its '_'.
  static bool FindSubstitution(const std::string& testcase, size_t from,
                               size_t* begin, size_t* end);
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REPLACE_SUBSTITUTION_REDUCTION_PASS_H_
