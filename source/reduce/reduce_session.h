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

#ifndef SOURCE_REDUCE_REDUCE_SESSION_H_
#define SOURCE_REDUCE_REDUCE_SESSION_H_

#include <string>

#include "source/reduce/oracle.h"
#include "source/reduce/reduction_cache.h"
#include "symtools/libsymtools.hpp"

namespace symtools {
namespace reduce {

// Minimizes |testcase| with respect to |oracle| and stores the outcome in
// |result|.
//
// A leading "_Z" is kept out of the reach of the passes and put back in front
// of the result.  |cache| may be null; see Reducer::Run() for how it is used.
// Progress is reported to |consumer| unless |options| asks for quiet
// operation.  |result| is only meaningful if ReductionStatus::Complete is
// returned.
ReductionStatus ReduceTestcase(const std::string& testcase, Oracle* oracle,
                               const ReducerOptions& options,
                               ReductionCache* cache,
                               const MessageConsumer& consumer,
                               std::string* result);

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REDUCE_SESSION_H_
