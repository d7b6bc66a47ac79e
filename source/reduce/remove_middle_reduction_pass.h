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

#ifndef SOURCE_REDUCE_REMOVE_MIDDLE_REDUCTION_PASS_H_
#define SOURCE_REDUCE_REMOVE_MIDDLE_REDUCTION_PASS_H_

#include "source/reduce/reduction_pass.h"

namespace symtools {
namespace reduce {

// A reduction pass that deletes a span [pos1, pos2) strictly inside the
// testcase; the last character is never deleted.  Left boundaries are tried
// from left to right and the first deletion the oracle accepts wins.
//
// The linear variant only deletes spans of up to four characters, trying the
// shortest first, which keeps the number of oracle invocations linear in the
// length of the testcase.  The quadratic variant tries every span, longest
// first.
class RemoveMiddleReductionPass : public ReductionPass {
 public:
  enum class Variant { Linear, Quadratic };

  RemoveMiddleReductionPass(Oracle* oracle, bool quiet, Variant variant)
      : ReductionPass(variant == Variant::Linear ? "remove middle (linear)"
                                                 : "remove middle (quadratic)",
                      oracle, quiet),
        variant_(variant) {}

  ~RemoveMiddleReductionPass() override = default;

  bool Gate(const std::string& testcase) const final;

  std::string Run(const std::string& testcase) final;

 private:
  // Tries to delete [pos1, pos2) from |testcase|.  Stores the accepted
  // candidate in |result| and returns true on success.
  bool TryRemove(const std::string& testcase, size_t pos1, size_t pos2,
                 std::string* result);

  const Variant variant_;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REMOVE_MIDDLE_REDUCTION_PASS_H_
