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

#include "source/reduce/reduce_session.h"

#include "source/reduce/reducer.h"
#include "source/reduce/reduction_util.h"

namespace symtools {
namespace reduce {

namespace {
const char kMangledPrefix[] = "_Z";
}  // namespace

ReductionStatus ReduceTestcase(const std::string& testcase, Oracle* oracle,
                               const ReducerOptions& options,
                               ReductionCache* cache,
                               const MessageConsumer& consumer,
                               std::string* result) {
  const std::string prefix_string(kMangledPrefix);
  std::string prefix;
  std::string body = testcase;
  if (testcase.compare(0, prefix_string.size(), prefix_string) == 0) {
    if (!options.GetQuiet()) {
      consumer(MessageLevel::Info, nullptr, "Note: will preserve _Z prefix");
    }
    prefix = prefix_string;
    body = testcase.substr(prefix_string.size());
  }

  PrefixedOracle prefixed_oracle(prefix, oracle);
  Reducer reducer(prefix.empty() ? oracle : &prefixed_oracle, options);
  reducer.SetMessageConsumer(consumer);

  std::string reduced;
  const ReductionStatus status = reducer.Run(body, &reduced, cache);
  if (status != ReductionStatus::Complete) {
    return status;
  }

  *result = prefix + reduced;
  if (!options.GetQuiet()) {
    const std::string message =
        "Done: \"" + prefix + EscapeString(reduced) + "\"";
    consumer(MessageLevel::Info, nullptr, message.c_str());
  }
  return status;
}

}  // namespace reduce
}  // namespace symtools
