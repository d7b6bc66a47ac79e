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

#ifndef SOURCE_REDUCE_SHORTEN_IDENTIFIER_REDUCTION_PASS_H_
#define SOURCE_REDUCE_SHORTEN_IDENTIFIER_REDUCTION_PASS_H_

#include <cstddef>

#include "source/reduce/reduction_pass.h"

namespace symtools {
namespace reduce {

// A reduction pass that replaces length-prefixed identifiers, such as
// "5hello", with one-character identifiers "1A", "1B", ..., "1Z", "1A", ...
// Identifiers are visited from left to right and every decision is final: a
// rejected identifier is kept as it is and the next one is tried with the same
// letter.
class ShortenIdentifierReductionPass : public ReductionPass {
 public:
  ShortenIdentifierReductionPass(Oracle* oracle, bool quiet)
      : ReductionPass("shorten identifiers", oracle, quiet) {}

  ~ShortenIdentifierReductionPass() override = default;

  bool Gate(const std::string& testcase) const final;

  std::string Run(const std::string& testcase) final;

  // Finds the first length-prefixed identifier of |testcase| at or after
  // |from| whose length is greater than one and whose payload fits in the
  // testcase.  A length is a run of at most seven decimal digits.  Returns
  // false if there is none; otherwise stores in |begin| and |end| the span
  // covering the length and the payload.
  static bool FindIdentifier(const std::string& testcase, size_t from,
                             size_t* begin, size_t* end);
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_SHORTEN_IDENTIFIER_REDUCTION_PASS_H_
