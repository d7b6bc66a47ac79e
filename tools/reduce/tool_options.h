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

#ifndef TOOLS_REDUCE_TOOL_OPTIONS_H_
#define TOOLS_REDUCE_TOOL_OPTIONS_H_

#include <cstdint>
#include <string>

#include "source/reduce/crash_oracle.h"
#include "symtools/libsymtools.hpp"

// Fills |options| from the values of the oracle-related flags.  |target| is
// split at spaces into the command line.  |memory_limit_mib| is in MiB.
// Returns false, after printing an error, if |target| names no program.
bool ParseOracleOptions(const std::string& target, uint32_t cpu_limit_seconds,
                        uint32_t memory_limit_mib, uint32_t wall_limit_ms,
                        symtools::OracleOptions* options);

// The outcome of running the target on a testcase before reducing it.
enum class CrashCheck {
  Crashes,
  DoesNotCrash,
  LaunchFailed,
};

// Runs the target of |oracle| once on |testcase|.  If the target crashes and
// |match_signal| is set, |oracle| from then on only accepts candidates that
// end with the same signal; otherwise it accepts any signal.  A run killed by
// the wall-clock watchdog does not crash.
CrashCheck CheckCrash(symtools::reduce::CrashOracle* oracle,
                      const std::string& testcase, bool match_signal);

// Renders a diagnostic as "<level>: <source>: <message>", leaving out the
// source if there is none.
std::string FormatDiagnostic(symtools::MessageLevel level, const char* source,
                             const char* message);

// Returns a consumer that prints errors and warnings to standard error.
// Informational messages go to standard output, as they are, if |show_info|
// is set.  Debug messages are dropped.
symtools::MessageConsumer MakeConsoleConsumer(bool show_info);

#endif  // TOOLS_REDUCE_TOOL_OPTIONS_H_
