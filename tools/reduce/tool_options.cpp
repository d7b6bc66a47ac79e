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

#include "tools/reduce/tool_options.h"

#include <cstdio>
#include <vector>

namespace {

const char* LevelName(symtools::MessageLevel level) {
  switch (level) {
    case symtools::MessageLevel::Fatal:
      return "fatal";
    case symtools::MessageLevel::InternalError:
      return "internal error";
    case symtools::MessageLevel::Error:
      return "error";
    case symtools::MessageLevel::Warning:
      return "warning";
    case symtools::MessageLevel::Info:
      return "info";
    case symtools::MessageLevel::Debug:
      return "debug";
  }
  return "unknown";
}

}  // namespace

bool ParseOracleOptions(const std::string& target, uint32_t cpu_limit_seconds,
                        uint32_t memory_limit_mib, uint32_t wall_limit_ms,
                        symtools::OracleOptions* options) {
  std::vector<std::string> command;
  size_t begin = 0;
  while (begin < target.size()) {
    size_t end = target.find(' ', begin);
    if (end == std::string::npos) {
      end = target.size();
    }
    if (end > begin) {
      command.push_back(target.substr(begin, end - begin));
    }
    begin = end + 1;
  }
  if (command.empty()) {
    fprintf(stderr, "error: no target program specified.\n");
    return false;
  }

  options->SetTargetCommand(command);
  options->SetCpuLimitSeconds(cpu_limit_seconds);
  options->SetMemoryLimitBytes(static_cast<uint64_t>(memory_limit_mib) << 20);
  options->SetWallLimitMs(wall_limit_ms);
  return true;
}

CrashCheck CheckCrash(symtools::reduce::CrashOracle* oracle,
                      const std::string& testcase, bool match_signal) {
  const symtools::reduce::ExecutionResult result = oracle->Execute(testcase);
  if (!result.launched) {
    return CrashCheck::LaunchFailed;
  }
  if (result.timed_out || !result.signaled) {
    return CrashCheck::DoesNotCrash;
  }
  oracle->SetExpectedSignal(match_signal ? result.signal_number : 0);
  return CrashCheck::Crashes;
}

std::string FormatDiagnostic(symtools::MessageLevel level, const char* source,
                             const char* message) {
  std::string text = LevelName(level);
  text += ": ";
  if (source) {
    text += source;
    text += ": ";
  }
  if (message) {
    text += message;
  }
  return text;
}

symtools::MessageConsumer MakeConsoleConsumer(bool show_info) {
  return [show_info](symtools::MessageLevel level, const char* source,
                     const char* message) {
    switch (level) {
      case symtools::MessageLevel::Fatal:
      case symtools::MessageLevel::InternalError:
      case symtools::MessageLevel::Error:
      case symtools::MessageLevel::Warning:
        fprintf(stderr, "%s\n",
                FormatDiagnostic(level, source, message).c_str());
        break;
      case symtools::MessageLevel::Info:
        if (show_info) {
          printf("%s\n", message);
          fflush(stdout);
        }
        break;
      case symtools::MessageLevel::Debug:
        break;
    }
  };
}
