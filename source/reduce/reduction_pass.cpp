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

#include "source/reduce/reduction_pass.h"

#include <utility>

#include "source/reduce/reduction_util.h"

namespace symtools {
namespace reduce {

ReductionPass::ReductionPass(std::string name, Oracle* oracle, bool quiet)
    : name_(std::move(name)),
      oracle_(oracle),
      quiet_(quiet),
      consumer_(IgnoreMessage) {}

void ReductionPass::SetMessageConsumer(MessageConsumer consumer) {
  consumer_ = std::move(consumer);
}

bool ReductionPass::ApplyOnce(const std::string& testcase,
                              std::string* result) {
  if (!Gate(testcase)) {
    *result = testcase;
    return false;
  }
  ReportPassName();
  *result = Run(testcase);
  return *result != testcase;
}

bool ReductionPass::ApplyToFixpoint(const std::string& testcase,
                                    std::string* result) {
  std::string current = testcase;
  bool worked = false;
  while (Gate(current)) {
    if (!worked) {
      ReportPassName();
    }
    std::string next = Run(current);
    if (next == current) {
      break;
    }
    worked = true;
    current = std::move(next);
  }
  *result = std::move(current);
  return worked;
}

bool ReductionPass::TestReduction(const std::vector<std::string>& from,
                                  const std::string& candidate) {
  if (oracle_->HasFailed() || !oracle_->Verify(candidate)) {
    return false;
  }
  if (!quiet_) {
    std::string message = "Reduced: \"";
    for (size_t i = 0; i < from.size(); ++i) {
      if (i != 0) {
        message += " | ";
      }
      message += EscapeString(from[i]);
    }
    message += "\" -> \"" + EscapeString(candidate) + "\"";
    consumer_(MessageLevel::Info, name_.c_str(), message.c_str());
  }
  return true;
}

void ReductionPass::ReportPassName() const {
  if (!quiet_) {
    consumer_(MessageLevel::Info, name_.c_str(), ("Pass: " + name_).c_str());
  }
}

}  // namespace reduce
}  // namespace symtools
