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

#ifndef SOURCE_REDUCE_REPLACE_BALANCED_REDUCTION_PASS_H_
#define SOURCE_REDUCE_REPLACE_BALANCED_REDUCTION_PASS_H_

#include "source/reduce/reduction_pass.h"

namespace symtools {
namespace reduce {

// A reduction pass for groups that open with 'J', 'I' or 'N' (argument packs,
// template arguments, nested names) and close with 'E'.  For an opener and a
// candidate closer, the whole group is first replaced with the identifier
// "1A"; failing that, the group is kept but its contents are replaced with a
// single "i" (int), giving "<opener>iE".  Closers are tried nearest first;
// an opener with no working closer is passed over.
//
// At most one group is replaced per run, so the pass is meant to be applied
// to a fixpoint.
class ReplaceBalancedReductionPass : public ReductionPass {
 public:
  ReplaceBalancedReductionPass(Oracle* oracle, bool quiet)
      : ReductionPass("replace balanced groups", oracle, quiet) {}

  ~ReplaceBalancedReductionPass() override = default;

  bool Gate(const std::string& testcase) const final;

  std::string Run(const std::string& testcase) final;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REPLACE_BALANCED_REDUCTION_PASS_H_
