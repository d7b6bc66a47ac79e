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

#ifndef SOURCE_REDUCE_REDUCTION_PASS_H_
#define SOURCE_REDUCE_REDUCTION_PASS_H_

#include <string>
#include <vector>

#include "source/reduce/oracle.h"
#include "symtools/libsymtools.hpp"

namespace symtools {
namespace reduce {

// Abstract class of a reduction pass.  A pass encapsulates one strategy for
// making a testcase smaller: Gate() cheaply decides whether the strategy
// applies at all, and Run() proposes candidates, keeping only those that the
// oracle confirms still reproduce the crash.
//
// A pass holds no state about the testcase; it can be applied to any number of
// testcases in turn.
class ReductionPass {
 public:
  // Constructs a pass called |name| that validates candidates with |oracle|,
  // which is not owned and must outlive the pass.  If |quiet| is true, no
  // progress messages are emitted.
  //
  // The constructed instance will have an empty message consumer, which just
  // ignores all messages.  Use SetMessageConsumer() to supply one if messages
  // are of concern.
  ReductionPass(std::string name, Oracle* oracle, bool quiet);

  virtual ~ReductionPass() = default;

  ReductionPass(const ReductionPass&) = delete;
  ReductionPass& operator=(const ReductionPass&) = delete;

  // Returns a descriptive name for this pass.
  const std::string& GetName() const { return name_; }

  // Sets the message consumer to the given |consumer|.  It receives a message
  // when the pass starts working on a testcase and one for every accepted
  // reduction.
  void SetMessageConsumer(MessageConsumer consumer);

  // Returns true if the pass may be able to reduce |testcase|.  Must not call
  // the oracle and must accept any string, including the empty one.
  virtual bool Gate(const std::string& testcase) const = 0;

  // Applies the strategy to |testcase| and returns the best testcase the
  // oracle accepted, which is |testcase| itself if nothing was accepted.
  virtual std::string Run(const std::string& testcase) = 0;

  // If the gate holds for |testcase|, runs the pass once.  The outcome is
  // stored in |result|.  Returns true if |result| differs from |testcase|.
  bool ApplyOnce(const std::string& testcase, std::string* result);

  // Runs the pass repeatedly, starting from |testcase|, until the gate no
  // longer holds or a run makes no change.  The outcome is stored in
  // |result|.  Returns true if any run changed the testcase.
  bool ApplyToFixpoint(const std::string& testcase, std::string* result);

 protected:
  // Asks the oracle whether |candidate| still reproduces the crash.  On
  // success the reduction is reported, with |from| listing the pieces of the
  // original testcase (kept prefix, changed span, kept suffix, as far as they
  // apply).  Once the oracle has failed, returns false without consulting it.
  bool TestReduction(const std::vector<std::string>& from,
                     const std::string& candidate);

 private:
  void ReportPassName() const;

  const std::string name_;
  Oracle* oracle_;
  const bool quiet_;
  MessageConsumer consumer_;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REDUCTION_PASS_H_
