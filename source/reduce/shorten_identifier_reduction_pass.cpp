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

#include "source/reduce/shorten_identifier_reduction_pass.h"

#include <cstdint>
#include <utility>

namespace symtools {
namespace reduce {

namespace {
const size_t kMaxLengthDigits = 7;

bool IsDecimalDigit(char c) { return c >= '0' && c <= '9'; }
}  // namespace

bool ShortenIdentifierReductionPass::FindIdentifier(const std::string& testcase,
                                                    size_t from, size_t* begin,
                                                    size_t* end) {
  size_t pos = from;
  while (pos < testcase.size()) {
    if (!IsDecimalDigit(testcase[pos])) {
      ++pos;
      continue;
    }
    // Longer digit runs are split into several lengths.
    size_t digits_end = pos;
    uint32_t length = 0;
    while (digits_end < testcase.size() &&
           digits_end - pos < kMaxLengthDigits &&
           IsDecimalDigit(testcase[digits_end])) {
      length = length * 10 + static_cast<uint32_t>(testcase[digits_end] - '0');
      ++digits_end;
    }
    if (length > 1 && length <= testcase.size() - digits_end) {
      *begin = pos;
      *end = digits_end + length;
      return true;
    }
    pos = digits_end;
  }
  return false;
}

bool ShortenIdentifierReductionPass::Gate(const std::string& testcase) const {
  size_t begin;
  size_t end;
  return FindIdentifier(testcase, 0, &begin, &end);
}

std::string ShortenIdentifierReductionPass::Run(const std::string& testcase) {
  // |head| is the already decided part of the result; |cursor| is where the
  // undecided part of |testcase| starts.
  std::string head;
  size_t cursor = 0;
  char next_id = 'A';
  size_t begin;
  size_t end;
  while (FindIdentifier(testcase, cursor, &begin, &end)) {
    const std::string kept = head + testcase.substr(cursor, begin - cursor);
    std::string new_head = kept + '1' + next_id;
    const std::string candidate = new_head + testcase.substr(end);
    if (TestReduction(
            {kept, testcase.substr(begin, end - begin), testcase.substr(end)},
            candidate)) {
      head = std::move(new_head);
      next_id = next_id == 'Z' ? 'A' : static_cast<char>(next_id + 1);
    } else {
      head += testcase.substr(cursor, end - cursor);
    }
    cursor = end;
  }
  return head + testcase.substr(cursor);
}

}  // namespace reduce
}  // namespace symtools
