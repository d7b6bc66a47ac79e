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

#include "tools/util/flags.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <limits>
#include <regex>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace flags {

std::vector<FlagList::FlagInfo> FlagList::flags_;
std::vector<std::string> positional_arguments;

namespace {
// Returns the flag name of |token|, including its hyphens.  For long-form
// flags, anything from the first '=' on is the value and is dropped.
inline std::string get_flag_name(const std::string& token, bool is_short_flag) {
  if (is_short_flag) {
    return token;
  }

  size_t equal_index = token.find('=');
  if (equal_index == std::string::npos) {
    return token;
  }
  return token.substr(0, equal_index);
}

// Returns the value of the flag at |*iterator|: the text after '=' for long
// flags written that way, otherwise the next token, in which case |*iterator|
// is advanced to it.  Returns false if there is no value.
bool get_flag_value(bool is_short_flag, const char*** iterator,
                    std::string* value) {
  const std::string raw_flag(**iterator);
  const size_t equal_index = raw_flag.find('=');
  if (is_short_flag || equal_index == std::string::npos) {
    if ((*iterator)[1] == nullptr) {
      return false;
    }

    *value = (*iterator)[1];
    *iterator += 1;
    return true;
  }

  *value = raw_flag.substr(equal_index + 1);
  return true;
}

bool parse_flag(Flag<bool>& flag, bool is_short_flag,
                const std::string& token) {
  if (is_short_flag) {
    flag.value() = true;
    return true;
  }

  size_t equal_index = token.find('=');
  if (equal_index == std::string::npos) {
    flag.value() = true;
    return true;
  }

  const std::string value = token.substr(equal_index + 1);
  if (value == "true") {
    flag.value() = true;
    return true;
  }

  if (value == "false") {
    flag.value() = false;
    return true;
  }

  return false;
}

bool parse_flag(Flag<std::string>& flag, bool is_short_flag,
                const char*** iterator) {
  return get_flag_value(is_short_flag, iterator, &flag.value());
}

// Accepts decimal digits only; no sign, no whitespace, no overflow.
bool parse_flag(Flag<uint32_t>& flag, bool is_short_flag,
                const char*** iterator) {
  std::string value;
  if (!get_flag_value(is_short_flag, iterator, &value) || value.empty()) {
    return false;
  }

  uint64_t result = 0;
  for (char c : value) {
    if (c < '0' || c > '9') {
      return false;
    }
    result = result * 10 + static_cast<uint64_t>(c - '0');
    if (result > std::numeric_limits<uint32_t>::max()) {
      return false;
    }
  }
  flag.value() = static_cast<uint32_t>(result);
  return true;
}
}  // namespace

bool FlagList::parse_flag_info(FlagInfo& info, const char*** iterator) {
  bool success = false;

  std::visit(
      [&](auto&& item) {
        using T = std::decay_t<decltype(item.get())>;
        if constexpr (std::is_same_v<T, Flag<bool>>) {
          success = parse_flag(item.get(), info.is_short, **iterator);
        } else if constexpr (std::is_same_v<T, Flag<std::string>>) {
          success = parse_flag(item.get(), info.is_short, iterator);
        } else if constexpr (std::is_same_v<T, Flag<uint32_t>>) {
          success = parse_flag(item.get(), info.is_short, iterator);
        } else {
          static_assert(always_false_v<T>, "Unsupported flag type.");
        }
      },
      info.flag);

  return success;
}

void FlagList::print_usage(const char* binary_name,
                           const std::string& usage_format) {
  std::string required = "";
  for (const auto& flag : flags_) {
    if (!flag.required) {
      continue;
    }

    if (flag.is_short) {
      required += flag.name + " ";
    } else {
      required += flag.name + "=<value> ";
    }
  }

  const std::regex binary_re("\\{binary\\}");
  const std::regex required_re("\\{required\\}");
  std::string usage = std::regex_replace(usage_format, binary_re, binary_name);
  usage = std::regex_replace(usage, required_re, required);
  std::cout << "USAGE: " << usage << std::endl << std::endl;
}

void FlagList::print_help(const char** argv, const std::string& usage_format,
                          const std::string& title,
                          const std::string& summary) {
  std::cout << title << std::endl << std::endl;
  print_usage(argv[0], usage_format);
  std::cout << summary << std::endl << std::endl;

  size_t longest_flag = 0;
  for (const auto& flag : flags_) {
    longest_flag = std::max(longest_flag, flag.name.size());
  }

  std::cout << "OPTIONS:" << std::endl;
  for (const auto& flag : flags_) {
    const size_t inline_alignment = longest_flag - flag.name.size() + 1;
    std::cout << "  " << flag.name << ":" << std::string(inline_alignment, ' ')
              << flag.help << std::endl;
  }
}

bool FlagList::parse(const char** argv) {
  flags::positional_arguments.clear();
  std::unordered_set<const FlagInfo*> parsed_flags;

  bool ignore_flags = false;
  for (const char** it = argv + 1; *it != nullptr; it++) {
    if (ignore_flags) {
      flags::positional_arguments.emplace_back(*it);
      continue;
    }

    if (std::strcmp(*it, "--") == 0) {
      ignore_flags = true;
      continue;
    }

    // A lone '-' is positional.
    if (std::strcmp(*it, "-") == 0) {
      flags::positional_arguments.emplace_back(*it);
      continue;
    }

    const std::string raw_flag(*it);
    if (raw_flag.empty()) {
      continue;
    }

    if (raw_flag[0] != '-') {
      flags::positional_arguments.emplace_back(*it);
      continue;
    }

    const bool is_short_flag = std::strncmp(*it, "--", 2) != 0;
    const std::string flag_name = get_flag_name(raw_flag, is_short_flag);

    auto needle = std::find_if(
        flags_.begin(), flags_.end(),
        [&flag_name](const auto& item) { return item.name == flag_name; });
    if (needle == flags_.end()) {
      std::cerr << "error: unknown flag " << flag_name << std::endl;
      return false;
    }

    if (parsed_flags.count(&*needle) != 0) {
      std::cerr << "error: the flag " << flag_name
                << " was specified multiple times." << std::endl;
      return false;
    }
    parsed_flags.insert(&*needle);

    if (!parse_flag_info(*needle, &it)) {
      std::cerr << "error: invalid usage for flag " << flag_name << std::endl;
      return false;
    }
  }

  for (const auto& flag : flags_) {
    if (flag.required && parsed_flags.count(&flag) == 0) {
      std::cerr << "error: missing required flag " << flag.name << std::endl;
      return false;
    }
  }

  return true;
}

bool Parse(const char** argv) { return FlagList::parse(argv); }

void PrintHelp(const char** argv, const std::string& usage_format,
               const std::string& title, const std::string& summary) {
  FlagList::print_help(argv, usage_format, title, summary);
}

}  // namespace flags
