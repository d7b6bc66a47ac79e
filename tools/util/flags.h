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

#ifndef TOOLS_UTIL_FLAGS_H_
#define TOOLS_UTIL_FLAGS_H_

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

// Helpers to declare the command-line interface of the symtools binaries.
//  - Flag order is not checked.
//  - Supported flag types: BOOLEAN, STRING, UINT (32-bit unsigned).
//  - A lone '--' ends the flags; every following token is positional.
//      symtools-reduce --slow -- --not-a-flag
//  - Boolean flags take no separate value token:
//        -h, --slow, --slow=true, --slow=false : allowed
//        --slow true                           : NOT allowed
//  - String and uint flags take their value either after '=' (long form only)
//    or as the next token, which is not checked for hyphens:
//        -f testcase.txt, --target=c++filt, --cpu-limit 2
//  - The flag variable name is the flag name with hyphens replaced by
//    underscores:
//      FLAG_LONG_uint(wall_limit, [...])
//        ->  in the code: flags::wall_limit.value()
//        -> command-line: --wall-limit
//
// Typical use:
//
// ```c
//  FLAG_SHORT_bool(h, /*default=*/ false, "Print the help.", false);
//  FLAG_LONG_uint(cpu_limit, /*default=*/ 1, "CPU seconds per run.", false);
//
//  int main(int argc, const char** argv) {
//    if (!flags::Parse(argv)) {
//      return 1;
//    }
//    if (flags::h.value()) {
//      flags::PrintHelp(argv, "{binary} [options] [<symbol>]", "title",
//                       "summary");
//      return 0;
//    }
//    ...
//  }
// ```

// Flag declarations.  Must be used at global scope.
#define FLAG_LONG_string(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_LONG(std::string, Name, Default, Help, Required)
#define FLAG_LONG_bool(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_LONG(bool, Name, Default, Help, Required)
#define FLAG_LONG_uint(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_LONG(uint32_t, Name, Default, Help, Required)

#define FLAG_SHORT_string(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_SHORT(std::string, Name, Default, Help, Required)
#define FLAG_SHORT_bool(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_SHORT(bool, Name, Default, Help, Required)
#define FLAG_SHORT_uint(Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG_SHORT(uint32_t, Name, Default, Help, Required)

namespace flags {

// Parses the null-terminated |argv| received by main(), setting the declared
// flags and collecting positional arguments.  Errors are printed to stderr.
// Returns `true` if the parsing succeeds, `false` otherwise.
bool Parse(const char** argv);

// Prints the help for the registered flags to stdout: |title|, the usage line,
// |summary| and one line per flag.  In |usage_format|, {binary} is replaced
// with argv[0] and {required} with the list of required flags.
void PrintHelp(const char** argv, const std::string& usage_format,
               const std::string& title, const std::string& summary);

}  // namespace flags

// ===================== BEGIN NON-PUBLIC SECTION =============================
// Implementation details; use the macros and functions above instead.

// Defines the flag variable, and registers it with the global list.
// The trailing `extern` declaration only exists to let the macro end with a
// semicolon.
#define UTIL_FLAGS_FLAG(Type, Prefix, Name, Default, Help, Required, IsShort) \
  namespace flags {                                                           \
  Flag<Type> Name(Default);                                                   \
  namespace {                                                                 \
  static FlagRegistration Name##_registration(Name, Prefix #Name, Help,       \
                                              Required, IsShort);             \
  }                                                                           \
  }                                                                           \
  extern flags::Flag<Type> flags::Name

#define UTIL_FLAGS_FLAG_LONG(Type, Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG(Type, "--", Name, Default, Help, Required, false)
#define UTIL_FLAGS_FLAG_SHORT(Type, Name, Default, Help, Required) \
  UTIL_FLAGS_FLAG(Type, "-", Name, Default, Help, Required, true)

namespace flags {

extern std::vector<std::string> positional_arguments;

// Holds the value of one flag.
template <typename T>
struct Flag {
 public:
  Flag(T&& default_value) : value_(default_value) {}
  Flag(Flag&& other) = delete;
  Flag(const Flag& other) = delete;

  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  T value_;
};

// New flag types need an entry here and a case in
// FlagList::parse_flag_info().
using FlagType = std::variant<std::reference_wrapper<Flag<std::string>>,
                              std::reference_wrapper<Flag<bool>>,
                              std::reference_wrapper<Flag<uint32_t>>>;

template <class>
inline constexpr bool always_false_v = false;

// Static registry of the declared flags.
class FlagList {
  struct FlagInfo {
    FlagInfo(FlagType&& flag_, std::string&& name_, std::string&& help_,
             bool required_, bool is_short_)
        : flag(std::move(flag_)),
          name(std::move(name_)),
          help(std::move(help_)),
          required(required_),
          is_short(is_short_) {}

    FlagType flag;
    std::string name;
    std::string help;
    bool required;
    bool is_short;
  };

 public:
  template <typename T>
  static void register_flag(Flag<T>& flag, std::string&& name,
                            std::string&& help, bool required, bool is_short) {
    flags_.emplace_back(flag, std::move(name), std::move(help), required,
                        is_short);
  }

  static bool parse(const char** argv);
  static void print_help(const char** argv, const std::string& usage_format,
                         const std::string& title, const std::string& summary);

#ifdef TESTING
  // The registry is static and gtest runs all tests in one process, so tests
  // clear it at teardown.
  static void reset() {
    flags_.clear();
    positional_arguments.clear();
  }
#endif

 private:
  static bool parse_flag_info(FlagInfo& info, const char*** iterator);
  static void print_usage(const char* binary_name,
                          const std::string& usage_format);

  static std::vector<FlagInfo> flags_;
};

template <typename T>
struct FlagRegistration {
  FlagRegistration(Flag<T>& flag, std::string&& name, std::string&& help,
                   bool required, bool is_short) {
    std::string fixed_name = name;
    for (auto& c : fixed_name) {
      if (c == '_') {
        c = '-';
      }
    }

    FlagList::register_flag(flag, std::move(fixed_name), std::move(help),
                            required, is_short);
  }
};

}  // namespace flags

#endif  // TOOLS_UTIL_FLAGS_H_
