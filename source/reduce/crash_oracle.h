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

#ifndef SOURCE_REDUCE_CRASH_ORACLE_H_
#define SOURCE_REDUCE_CRASH_ORACLE_H_

#include <cstdint>
#include <string>

#include "source/reduce/oracle.h"
#include "symtools/libsymtools.hpp"

namespace symtools {
namespace reduce {

// The observable outcome of running the target program once.
struct ExecutionResult {
  // False if the target could not be started at all.
  bool launched = false;
  // True if the wall-clock watchdog had to kill the target.
  bool timed_out = false;
  // True if the target was terminated by a signal.
  bool signaled = false;
  // The terminating signal, if |signaled|.
  int signal_number = 0;
  // The exit status, if the target exited normally.
  int exit_code = 0;
};

// An oracle that feeds each candidate, followed by a newline, to the standard
// input of a freshly started target program, and reports a crash if the
// program is terminated by a signal.  Each run is confined by the CPU, memory
// and wall-clock limits of the OracleOptions, so a hanging or runaway target
// cannot hang the reducer.
//
// A CPU or memory limit hit shows up as a signal too (SIGXCPU, SIGKILL,
// SIGSEGV, ...).  Set an expected signal to only count crashes that match the
// signature of the original one.  A run killed by the wall-clock watchdog
// never counts.
class CrashOracle : public Oracle {
 public:
  explicit CrashOracle(const OracleOptions& options);

  ~CrashOracle() override = default;

  // Sets the message consumer to the given |consumer|.  Launch failures are
  // reported to it.
  void SetMessageConsumer(MessageConsumer consumer);

  // Sets the signal that identifies the crash; 0 accepts any signal.
  void SetExpectedSignal(int signal_number);

  // Runs the target once with |candidate| and returns what happened.  Does not
  // change the failure state of the oracle.
  ExecutionResult Execute(const std::string& candidate);

  bool Verify(const std::string& candidate) override;

  bool HasFailed() const override { return failed_; }

  // Returns the number of times the target has been started.
  uint64_t GetInvocationCount() const { return invocation_count_; }

 private:
  // Reports |message| as an error to the consumer.
  void ReportError(const std::string& message);

  OracleOptions options_;
  MessageConsumer consumer_;
  bool failed_;
  uint64_t invocation_count_;
};

}  // namespace reduce
}  // namespace symtools

#endif  // SOURCE_REDUCE_CRASH_ORACLE_H_
