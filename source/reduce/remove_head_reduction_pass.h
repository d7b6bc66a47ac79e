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

#ifndef SOURCE_REDUCE_REMOVE_HEAD_REDUCTION_PASS_H_
#define SOURCE_REDUCE_REMOVE_HEAD_REDUCTION_PASS_H_

#include "source/reduce/reduction_pass.h"

namespace symtools {
namespace reduce {

// A reduction pass that keeps only a suffix of the testcase.  Suffixes are
// tried from the shortest up, and the first one the oracle accepts wins.
class RemoveHeadReductionPass : public ReductionPass {
 public:
  RemoveHeadReductionPass(Oracle* oracle, bool quiet)
      : ReductionPass("remove head", oracle, quiet) {}

  ~RemoveHeadReductionPass() override = default;

  bool Gate(const std::string& testcase) const final;

  std::string Run(const std::string& testcase) final;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REMOVE_HEAD_REDUCTION_PASS_H_
