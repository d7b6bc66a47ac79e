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

#include "test/reduce/reduce_test_util.h"

#include <utility>

namespace symtools {
namespace reduce {

bool RecordingOracle::Verify(const std::string& candidate) {
  queries_.push_back(candidate);
  return predicate_(candidate);
}

bool FailingOracle::Verify(const std::string&) {
  if (budget_ == 0) {
    failed_ = true;
  }
  if (failed_) {
    return false;
  }
  --budget_;
  return true;
}

MessageConsumer MakeRecordingConsumer(std::vector<RecordedMessage>* messages) {
  return [messages](MessageLevel level, const char* source,
                    const char* message) {
    messages->push_back(
        {level, source ? source : "", message ? message : ""});
  };
}

std::vector<std::string> MessagesAt(
    const std::vector<RecordedMessage>& messages, MessageLevel level) {
  std::vector<std::string> result;
  for (const auto& recorded : messages) {
    if (recorded.level == level) {
      result.push_back(recorded.message);
    }
  }
  return result;
}

bool StartsWith(const std::string& testcase, const std::string& prefix) {
  return testcase.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& testcase, const std::string& suffix) {
  return testcase.size() >= suffix.size() &&
         testcase.compare(testcase.size() - suffix.size(), suffix.size(),
                          suffix) == 0;
}

bool ContainsText(const std::string& testcase, const std::string& needle) {
  return testcase.find(needle) != std::string::npos;
}

void NopDiagnostic(MessageLevel /*level*/, const char* /*source*/,
                   const char* /*message*/) {}

}  // namespace reduce
}  // namespace symtools
