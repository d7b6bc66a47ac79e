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

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "source/reduce/crash_oracle.h"
#include "source/reduce/reduce_session.h"
#include "source/reduce/reduction_cache.h"
#include "source/reduce/reduction_util.h"
#include "symtools/libsymtools.hpp"
#include "tools/io.h"
#include "tools/reduce/tool_options.h"
#include "tools/util/flags.h"

static const std::string kTitle =
    "symtools-reduce-batch - Minimize one shard of a corpus of crashing "
    "symbols";
static const std::string kSummary =
    R"(Worker <M> of <N> (1 <= M <= N) minimizes the lines of the corpus whose
zero-based index i satisfies i mod N == M - 1.  Results that no earlier line
of this worker already led to are appended to the worker's output file,
which defaults to the corpus directory entry crashes_ascii_min_<M>.txt.
Lines that do not crash the target are skipped.)";

static const char kDefaultInput[] = "./corpora/filtered2/crashes_ascii.txt";
static const char kDefaultOutputPrefix[] =
    "./corpora/filtered2/crashes_ascii_min_";

// A progress line is printed for every this many skipped lines.
static const size_t kSkipReportInterval = 100;

FLAG_SHORT_bool(h, /* default_value= */ false, "Print this help.", false);
FLAG_LONG_bool(help, /* default_value= */ false, "Print this help.", false);
FLAG_LONG_string(input, /* default_value= */ kDefaultInput,
                 "The corpus, one symbol per line.", /* required= */ false);
FLAG_LONG_string(output, /* default_value= */ "",
                 "The output file of this worker.", /* required= */ false);
FLAG_LONG_bool(slow, /* default_value= */ false,
               "Also try to remove arbitrarily long spans from the middle of "
               "each symbol.",
               /* required= */ false);
FLAG_LONG_bool(fix_non_alnum, /* default_value= */ false,
               "Finally try to replace characters outside [A-Za-z0-9_].",
               /* required= */ false);
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
               "Wall-clock limit of one target run, in milliseconds. 0 "
               "disables.",
               /* required= */ false);
FLAG_LONG_bool(any_signal, /* default_value= */ false,
               "Accept any signal as a crash instead of only the signal each "
               "corpus line crashes with.",
               /* required= */ false);

namespace {

// Parses a positive decimal number.  Returns false if |text| is not one.
bool ParsePositive(const std::string& text, uint32_t* value) {
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return false;
  }
  char* end = nullptr;
  const unsigned long parsed = std::strtoul(text.c_str(), &end, 10);
  if (*end != '\0' || parsed == 0 || parsed > UINT32_MAX) {
    return false;
  }
  *value = static_cast<uint32_t>(parsed);
  return true;
}

}  // namespace

int main(int, const char** argv) {
  if (!flags::Parse(argv)) {
    return 1;
  }

  if (flags::h.value() || flags::help.value()) {
    flags::PrintHelp(argv, "{binary} [options] <N> <M>", kTitle, kSummary);
    return 0;
  }

  uint32_t num_workers = 0;
  uint32_t worker = 0;
  if (flags::positional_arguments.size() != 2 ||
      !ParsePositive(flags::positional_arguments[0], &num_workers) ||
      !ParsePositive(flags::positional_arguments[1], &worker)) {
    fprintf(stderr, "error: expected the worker count N and the worker "
                    "number M as positive integers.\n");
    return 1;
  }
  if (worker > num_workers) {
    fprintf(stderr, "error: the worker number must be between 1 and %u.\n",
            num_workers);
    return 1;
  }

  symtools::OracleOptions oracle_options;
  if (!ParseOracleOptions(flags::target.value(), flags::cpu_limit.value(),
                          flags::memory_limit.value(),
                          flags::wall_limit.value(), &oracle_options)) {
    return 1;
  }

  symtools::ReducerOptions reducer_options;
  reducer_options.SetSlowMode(flags::slow.value());
  reducer_options.SetFixNonAlnum(flags::fix_non_alnum.value());
  reducer_options.SetQuiet(true);

  std::vector<std::string> corpus;
  if (!ReadLines(flags::input.value().c_str(), &corpus)) {
    return 1;
  }

  std::string output_name = flags::output.value();
  if (output_name.empty()) {
    output_name = kDefaultOutputPrefix + std::to_string(worker) + ".txt";
  }
  OutputFile output(output_name.c_str(), "w");
  if (output.GetFileHandle() == nullptr) {
    fprintf(stderr, "error: could not open file '%s'\n", output_name.c_str());
    return 1;
  }

  const symtools::MessageConsumer consumer =
      MakeConsoleConsumer(/* show_info= */ false);
  symtools::reduce::CrashOracle oracle(oracle_options);
  oracle.SetMessageConsumer(consumer);
  symtools::reduce::ReductionCache cache;

  size_t count = 0;
  for (size_t index = 0; index < corpus.size(); ++index) {
    if (index % num_workers != worker - 1) {
      continue;
    }

    const CrashCheck check =
        CheckCrash(&oracle, corpus[index], !flags::any_signal.value());
    if (check == CrashCheck::LaunchFailed) {
      return 1;
    }

    std::string result;
    symtools::ReductionStatus status = symtools::ReductionStatus::NoNewResult;
    if (check == CrashCheck::Crashes) {
      status = symtools::reduce::ReduceTestcase(
          corpus[index], &oracle, reducer_options, &cache, consumer, &result);
    }
    if (status == symtools::ReductionStatus::OracleFailure) {
      return 1;
    }
    if (status == symtools::ReductionStatus::NoNewResult) {
      if (index % kSkipReportInterval == kSkipReportInterval - 1) {
        printf("Skipped... %zu\n", index + 1);
        fflush(stdout);
      }
      continue;
    }

    ++count;
    printf("Thread %u. \"%s\"; %zu minimized testcases, position: %zu\n",
           worker, symtools::reduce::EscapeString(result).c_str(), count,
           index + 1);
    fflush(stdout);
    if (!output.WriteLine(result)) {
      fprintf(stderr, "error: could not write to file '%s'\n",
              output_name.c_str());
      return 1;
    }
  }

  return 0;
}
