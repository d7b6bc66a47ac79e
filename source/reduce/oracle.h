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

#ifndef SOURCE_REDUCE_ORACLE_H_
#define SOURCE_REDUCE_ORACLE_H_

#include <functional>
#include <string>
#include <utility>

namespace symtools {
namespace reduce {

// Abstract class deciding whether a candidate testcase still reproduces the
// crash being minimized.  Implementations must be deterministic: the reducer
// and the cache assume that verifying the same candidate twice gives the same
// answer.
class Oracle {
 public:
  Oracle() = default;
  virtual ~Oracle() = default;

  Oracle(const Oracle&) = delete;
  Oracle& operator=(const Oracle&) = delete;

  // Returns true if |candidate| still reproduces the crash.  Returns false if
  // it does not, or if no verdict could be reached; the latter case is
  // reported by HasFailed().
  virtual bool Verify(const std::string& candidate) = 0;

  // Returns true if some earlier call to Verify() could not reach a verdict,
  // e.g. because the target program could not be launched.  Once set, the
  // failure is sticky.
  virtual bool HasFailed() const { return false; }
};

// An oracle backed by an arbitrary predicate.
class FunctionOracle : public Oracle {
 public:
  using Predicate = std::function<bool(const std::string&)>;

  explicit FunctionOracle(Predicate predicate)
      : predicate_(std::move(predicate)) {}

  ~FunctionOracle() override = default;

  bool Verify(const std::string& candidate) override {
    return predicate_(candidate);
  }

 private:
  Predicate predicate_;
};

// An oracle that verifies |prefix| + candidate with another oracle.  Used to
// keep a prefix of the testcase out of the reach of the reduction passes.
// Does not own |base|.
class PrefixedOracle : public Oracle {
 public:
  PrefixedOracle(std::string prefix, Oracle* base)
      : prefix_(std::move(prefix)), base_(base) {}

  ~PrefixedOracle() override = default;

  bool Verify(const std::string& candidate) override;

  bool HasFailed() const override { return base_->HasFailed(); }

 private:
  const std::string prefix_;
  Oracle* base_;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_ORACLE_H_
