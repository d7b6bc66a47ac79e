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

#ifndef SOURCE_REDUCE_REDUCTION_CACHE_H_
#define SOURCE_REDUCE_REDUCTION_CACHE_H_

#include <cstddef>
#include <string>
#include <unordered_set>

namespace symtools {
namespace reduce {

// The set of testcases that some reduction run has already started from or
// reached.  A run that arrives at a cached testcase stops, since continuing
// would only repeat earlier work.  The caller owns the cache and may keep it
// across runs, e.g. for every line of a corpus.  Not thread safe; each worker
// uses its own instance.
class ReductionCache {
 public:
  ReductionCache() = default;

  ReductionCache(const ReductionCache&) = delete;
  ReductionCache& operator=(const ReductionCache&) = delete;

  // Returns true if |testcase| has been inserted.
  bool Contains(const std::string& testcase) const {
    return seen_.count(testcase) != 0;
  }

  // Inserts |testcase|.  Returns false if it was already present.
  bool Insert(const std::string& testcase);

  size_t size() const { return seen_.size(); }

  void clear() { seen_.clear(); }

 private:
  std::unordered_set<std::string> seen_;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REDUCTION_CACHE_H_
