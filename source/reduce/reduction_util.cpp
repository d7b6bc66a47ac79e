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

#include "source/reduce/reduction_util.h"

#include <algorithm>
#include <cassert>

namespace symtools {
namespace reduce {

namespace {
const uint32_t kSubstitutionBase = 36;
const char kHexDigits[] = "0123456789abcdef";
}  // namespace

bool IsIdentifierChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

bool IsSubstitutionDigit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z');
}

std::string EscapeString(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    if (IsIdentifierChar(c)) {
      result += c;
      continue;
    }
    const auto byte = static_cast<unsigned char>(c);
    result += "\\x";
    result += kHexDigits[byte >> 4];
    result += kHexDigits[byte & 0xf];
  }
  return result;
}

std::string EncodeSubstitutionIndex(uint32_t value) {
  if (value == 0) {
    return "";
  }
  std::string result;
  uint32_t remaining = value - 1;
  do {
    const uint32_t digit = remaining % kSubstitutionBase;
    remaining /= kSubstitutionBase;
    result += static_cast<char>(digit < 10 ? '0' + digit : 'A' + digit - 10);
  } while (remaining != 0);
  std::reverse(result.begin(), result.end());
  return result;
}

uint32_t DecodeSubstitutionIndex(const std::string& token) {
  if (token.empty()) {
    return 0;
  }
  uint32_t result = 0;
  for (char c : token) {
    assert(IsSubstitutionDigit(c) && "Not a substitution index digit");
    const uint32_t digit = (c >= '0' && c <= '9')
                               ? static_cast<uint32_t>(c - '0')
                               : static_cast<uint32_t>(c - 'A') + 10;
    result = result * kSubstitutionBase + digit;
  }
  return result + 1;
}

}  // namespace reduce
}  // namespace symtools
