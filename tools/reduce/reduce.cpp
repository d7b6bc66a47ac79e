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

#include <cstdio>
#include <string>
#include <vector>

#include "source/reduce/crash_oracle.h"
#include "source/reduce/reduce_session.h"
#include "symtools/libsymtools.hpp"
#include "tools/io.h"
#include "tools/reduce/tool_options.h"
#include "tools/util/flags.h"

static const std::string kTitle =
    "symtools-reduce - Minimize a mangled symbol that crashes a demangler";
static const std::string kSummary =
    R"(The symbol is given on the command line, or read from the file named by -f
(one trailing newline is removed).  The target program is run on candidate
symbols, each written to its standard input, and a candidate is kept if the
target is killed by the same signal as on the original symbol.  Progress and
the minimized symbol are printed to standard output.)";

FLAG_SHORT_bool(h, /* default_value= */ false, "Print this help.", false);
FLAG_LONG_bool(help, /* default_value= */ false, "Print this help.", false);
FLAG_SHORT_string(f, /* default_value= */ "",
                  "Read the symbol from this file. Use '-' to mean stdin.",
                  /* required= */ false);
FLAG_SHORT_string(o, /* default_value= */ "",
                  "Also write the minimized symbol to this file. Use '-' to "
                  "mean stdout.",
                  /* required= */ false);
FLAG_LONG_bool(slow, /* default_value= */ false,
               "Also try to remove arbitrarily long spans from the middle of "
               "the symbol. Quadratic in the symbol length.",
               /* required= */ false);
FLAG_LONG_bool(fix_non_alnum, /* default_value= */ false,
               "Finally try to replace characters outside [A-Za-z0-9_].",
               /* required= */ false);
FLAG_LONG_bool(quiet, /* default_value= */ false,
               "Only report errors.", /* required= */ false);
FLAG_LONG_string(target, /* default_value= */ "c++filt",
                 "Command line of the target program, split at spaces.",
                 /* required= */ false);
FLAG_LONG_uint(cpu_limit, /* default_value= */ 1,
               "CPU time limit of one target run, in seconds. 0 disables.",
               /* required= */ false);
FLAG_LONG_uint(memory_limit, /* default_value= */ 256,
               "Address space limit of one target run, in MiB. 0 disables.",
               /* required= */ false);
FLAG_LONG_uint(wall_limit, /* default_value= */ 10000,
               "Wall-clock limit of one target run, in milliseconds. Runs "
               "that exceed it never count as crashes. 0 disables.",
               /* required= */ false);
FLAG_LONG_bool(any_signal, /* default_value= */ false,
               "Accept a crash by any signal, not only the one the original "
               "symbol is killed by.",
               /* required= */ false);

namespace {

const char kReductionStatusNames[][16] = {"complete", "no new result",
                                          "oracle failure"};

// Reads the testcase from the command line.  Returns false, after printing an
// error, if there is not exactly one source for it.
bool GetTestcase(std::string* testcase) {
  const bool has_symbol = !flags::positional_arguments.empty();
  const bool has_file = !flags::f.value().empty();
  if (flags::positional_arguments.size() > 1) {
    fprintf(stderr, "error: at most one symbol can be specified.\n");
    return false;
  }
  if (has_symbol && has_file) {
    fprintf(stderr, "error: specify either a symbol or -f, not both.\n");
    return false;
  }
  if (!has_symbol && !has_file) {
    fprintf(stderr, "error: no symbol or file specified.\n");
    return false;
  }

  if (has_symbol) {
    *testcase = flags::positional_arguments[0];
    return true;
  }
  if (!ReadTextFile(flags::f.value().c_str(), testcase)) {
    return false;
  }
  if (!testcase->empty() && testcase->back() == '\n') {
    testcase->pop_back();
  }
  return true;
}

}  // namespace

int main(int, const char** argv) {
  if (!flags::Parse(argv)) {
    return 1;
  }

  if (flags::h.value() || flags::help.value()) {
    flags::PrintHelp(argv, "{binary} [options] [<symbol>]", kTitle, kSummary);
    return 0;
  }

  std::string testcase;
  if (!GetTestcase(&testcase)) {
    return 1;
  }

  symtools::OracleOptions oracle_options;
  if (!ParseOracleOptions(
          flags::target.value(), flags::cpu_limit.value(),
          flags::memory_limit.value(), flags::wall_limit.value(),
          &oracle_options)) {
    return 1;
  }

  symtools::ReducerOptions reducer_options;
  reducer_options.SetSlowMode(flags::slow.value());
  reducer_options.SetFixNonAlnum(flags::fix_non_alnum.value());
  reducer_options.SetQuiet(flags::quiet.value());

  const symtools::MessageConsumer consumer =
      MakeConsoleConsumer(/* show_info= */ true);

  symtools::reduce::CrashOracle oracle(oracle_options);
  oracle.SetMessageConsumer(consumer);

  switch (CheckCrash(&oracle, testcase, !flags::any_signal.value())) {
    case CrashCheck::Crashes:
      break;
    case CrashCheck::DoesNotCrash:
      fprintf(stderr, "error: the symbol does not crash '%s'.\n",
              oracle_options.GetTargetCommand()[0].c_str());
      return 1;
    case CrashCheck::LaunchFailed:
      return 1;
  }

  std::string result;
  const symtools::ReductionStatus status = symtools::reduce::ReduceTestcase(
      testcase, &oracle, reducer_options, /* cache= */ nullptr, consumer,
      &result);
  if (status != symtools::ReductionStatus::Complete) {
    fprintf(stderr, "error: reduction stopped: %s.\n",
            kReductionStatusNames[static_cast<int>(status)]);
    return 1;
  }

  if (!flags::o.value().empty()) {
    const std::string contents = result + "\n";
    if (!WriteFile<char>(flags::o.value().c_str(), "w", contents.data(),
                         contents.size())) {
      return 1;
    }
  }

  return 0;
}
