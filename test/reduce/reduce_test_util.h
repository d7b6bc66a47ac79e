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

#ifndef TEST_REDUCE_REDUCE_TEST_UTIL_H_
#define TEST_REDUCE_REDUCE_TEST_UTIL_H_

#include <string>
#include <utility>
#include <vector>

#include "source/reduce/oracle.h"
#include "symtools/libsymtools.hpp"

namespace symtools {
namespace reduce {

// An oracle that accepts the candidates satisfying a predicate, and records
// every candidate it was asked about.
class RecordingOracle : public Oracle {
 public:
  explicit RecordingOracle(FunctionOracle::Predicate predicate)
      : predicate_(std::move(predicate)) {}

  ~RecordingOracle() override = default;

  bool Verify(const std::string& candidate) override;

  const std::vector<std::string>& GetQueries() const { return queries_; }

  size_t GetInvocationCount() const { return queries_.size(); }

 private:
  FunctionOracle::Predicate predicate_;
  std::vector<std::string> queries_;
};

// An oracle that accepts |budget| candidates and then fails for good, like a
// target program that can no longer be launched.
class FailingOracle : public Oracle {
 public:
  explicit FailingOracle(size_t budget) : budget_(budget), failed_(false) {}

  ~FailingOracle() override = default;

  bool Verify(const std::string& candidate) override;

  bool HasFailed() const override { return failed_; }

 private:
  size_t budget_;
  bool failed_;
};

// A message as received by a consumer.
struct RecordedMessage {
  MessageLevel level;
  std::string source;
  std::string message;
};

// Returns a consumer that appends every message to |messages|.
MessageConsumer MakeRecordingConsumer(std::vector<RecordedMessage>* messages);

// Returns the messages of |messages| at |level|, without level and source.
std::vector<std::string> MessagesAt(
    const std::vector<RecordedMessage>& messages, MessageLevel level);

// Returns true if |testcase| starts with |prefix|.
bool StartsWith(const std::string& testcase, const std::string& prefix);

// Returns true if |testcase| ends with |suffix|.
bool EndsWith(const std::string& testcase, const std::string& suffix);

// Returns true if |testcase| contains |needle|.
bool ContainsText(const std::string& testcase, const std::string& needle);

// A message consumer that ignores everything.
void NopDiagnostic(MessageLevel /*level*/, const char* /*source*/,
                   const char* /*message*/);

}  // namespace reduce
}  // namespace symtools

#endif  // TEST_REDUCE_REDUCE_TEST_UTIL_H_
