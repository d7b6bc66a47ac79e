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

#ifndef SOURCE_REDUCE_REDUCER_H_
#define SOURCE_REDUCE_REDUCER_H_

#include <memory>
#include <string>

#include "source/reduce/oracle.h"
#include "source/reduce/reduction_cache.h"
#include "symtools/libsymtools.hpp"

namespace symtools {
namespace reduce {

// Drives the fixed sequence of reduction passes over a single testcase:
//
//   1. shorten identifiers, once;
//   2. remove head and remove tail in turn, until neither makes progress;
//   3. replace balanced groups to fixpoint, back to 2 on progress;
//   4. replace substitutions to fixpoint, back to 2 on progress;
//   5. remove middle to fixpoint (linear, then quadratic in slow mode), back
//      to 2 on progress;
//   6. optionally, fix non-alphanumeric characters once.
class Reducer {
 public:
  // Constructs a reducer whose passes validate candidates with |oracle|, which
  // is not owned and must outlive the reducer.
  //
  // The constructed instance will have an empty message consumer, which just
  // ignores all messages from the library. Use SetMessageConsumer() to supply
  // one if messages are of concern.
  Reducer(Oracle* oracle, const ReducerOptions& options);

  // Disables copy/move constructor/assignment operations.
  Reducer(const Reducer&) = delete;
  Reducer(Reducer&&) = delete;
  Reducer& operator=(const Reducer&) = delete;
  Reducer& operator=(Reducer&&) = delete;

  // Destructs this instance.
  ~Reducer();

  // Sets the message consumer to the given |consumer|. The |consumer| will be
  // invoked once for each message communicated from the library, including
  // the messages of the passes.
  void SetMessageConsumer(MessageConsumer consumer);

  // Reduces |testcase|, which must be accepted by the oracle, and stores the
  // smallest accepted testcase found so far in |result|.
  //
  // If |cache| is not null, every testcase the run starts from or reaches is
  // recorded in it, and the run stops with ReductionStatus::NoNewResult as
  // soon as it meets one that was recorded before.  Returns
  // ReductionStatus::OracleFailure if the oracle could not reach a verdict.
  ReductionStatus Run(const std::string& testcase, std::string* result,
                      ReductionCache* cache) const;

 private:
  struct Impl;                  // Opaque struct for holding internal data.
  std::unique_ptr<Impl> impl_;  // Unique pointer to internal data.
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REDUCER_H_
