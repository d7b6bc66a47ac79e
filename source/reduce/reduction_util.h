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

#ifndef SOURCE_REDUCE_REDUCTION_UTIL_H_
#define SOURCE_REDUCE_REDUCTION_UTIL_H_

#include <cstdint>
#include <string>

namespace symtools {
namespace reduce {

// Returns true if |c| is one of [A-Za-z0-9_].  Independent of the locale.
bool IsIdentifierChar(char c);

// Returns true if |c| is one of [0-9A-Z], the alphabet of substitution
// indices.
bool IsSubstitutionDigit(char c);

// Returns |s| with every byte outside [A-Za-z0-9_] replaced by "\xHH", where
// HH is the byte value in lowercase hexadecimal.
std::string EscapeString(const std::string& s);

// Encodes a substitution index: 0 is the empty string, any other |value| is
// |value| - 1 written in base 36 with the digits [0-9A-Z].
std::string EncodeSubstitutionIndex(uint32_t value);

// Inverse of EncodeSubstitutionIndex.  Every character of |token| must satisfy
// IsSubstitutionDigit.
uint32_t DecodeSubstitutionIndex(const std::string& token);

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_REDUCTION_UTIL_H_
