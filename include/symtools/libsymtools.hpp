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

#ifndef INCLUDE_SYMTOOLS_LIBSYMTOOLS_HPP_
#define INCLUDE_SYMTOOLS_LIBSYMTOOLS_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace symtools {

// Severity levels of messages communicated to the consumer.
enum class MessageLevel {
  Fatal,          // Unrecoverable error due to environment.
                  // Will exit the program immediately. E.g.,
                  // out of memory.
  InternalError,  // Unrecoverable error due to SymTools internals.
                  // Will exit the program immediately. E.g.,
                  // unimplemented feature.
  Error,          // Normal error due to user input or the target program,
                  // e.g. the target could not be launched.
  Warning,        // Warning information.
  Info,           // General information, e.g. accepted reductions.
  Debug,          // Debug information, e.g. pipeline stages.
};

// Message consumer. The C strings for source and message are only alive for
// the specific invocation.
using MessageConsumer = std::function<void(
    MessageLevel /* level */, const char* /* source */,
    const char* /* message */
    )>;

// A message consumer that ignores all messages.
inline void IgnoreMessage(MessageLevel, const char*, const char*) {}

// Outcome of a reduction session.
enum class ReductionStatus {
  // The pipeline converged; the result holds the minimized testcase.
  Complete,
  // The cache showed that the input, or a string the pipeline reached, was
  // already processed.  There is no new result.
  NoNewResult,
  // The oracle could not reach a verdict (e.g. the target program could not
  // be launched).  The result is not meaningful.
  OracleFailure,
};

// Options controlling which passes the reducer runs and how chatty it is.
class ReducerOptions {
 public:
  ReducerOptions() : slow_mode_(false), fix_non_alnum_(false), quiet_(false) {}

  // Returns whether the quadratic variant of middle removal is run after the
  // linear one.  It tries every contiguous span and costs many more oracle
  // invocations.
  bool GetSlowMode() const { return slow_mode_; }

  // Sets whether the quadratic middle removal is run.
  void SetSlowMode(bool slow_mode) { slow_mode_ = slow_mode; }

  // Returns whether a final pass tries to replace every byte outside
  // [A-Za-z0-9_] with an alphanumeric one.
  bool GetFixNonAlnum() const { return fix_non_alnum_; }

  // Sets whether the final non-alphanumeric fixing pass is run.
  void SetFixNonAlnum(bool fix_non_alnum) { fix_non_alnum_ = fix_non_alnum; }

  // Returns whether pass progress ("Pass:", "Reduced:", "Done:") is
  // suppressed.
  bool GetQuiet() const { return quiet_; }

  // Sets whether pass progress is suppressed.
  void SetQuiet(bool quiet) { quiet_ = quiet; }

 private:
  bool slow_mode_;
  bool fix_non_alnum_;
  bool quiet_;
};

// Options for running the target program that decides whether a candidate
// still crashes.
class OracleOptions {
 public:
  OracleOptions()
      : target_command_({"c++filt"}),
        cpu_limit_seconds_(1),
        memory_limit_bytes_(256u << 20),
        wall_limit_ms_(10000),
        expected_signal_(0) {}

  // Returns the command line of the target program.  The first element is
  // looked up in PATH.  The candidate is fed through standard input.
  const std::vector<std::string>& GetTargetCommand() const {
    return target_command_;
  }

  // Sets the command line of the target program.
  void SetTargetCommand(std::vector<std::string> target_command) {
    target_command_ = std::move(target_command);
  }

  // Returns the CPU time limit (RLIMIT_CPU) of one invocation, in seconds.
  // Zero means no limit.
  uint32_t GetCpuLimitSeconds() const { return cpu_limit_seconds_; }

  // Sets the CPU time limit of one invocation.
  void SetCpuLimitSeconds(uint32_t seconds) { cpu_limit_seconds_ = seconds; }

  // Returns the address space limit (RLIMIT_AS) of one invocation, in bytes.
  // Zero means no limit.
  uint64_t GetMemoryLimitBytes() const { return memory_limit_bytes_; }

  // Sets the address space limit of one invocation.
  void SetMemoryLimitBytes(uint64_t bytes) { memory_limit_bytes_ = bytes; }

  // Returns the wall-clock limit of one invocation, in milliseconds, after
  // which the target is killed and the candidate rejected.  Zero means no
  // limit.
  uint32_t GetWallLimitMs() const { return wall_limit_ms_; }

  // Sets the wall-clock limit of one invocation.
  void SetWallLimitMs(uint32_t ms) { wall_limit_ms_ = ms; }

  // Returns the signal that identifies the crash, or 0 if termination by any
  // signal counts as a crash.
  int GetExpectedSignal() const { return expected_signal_; }

  // Sets the signal that identifies the crash.
  void SetExpectedSignal(int signal_number) {
    expected_signal_ = signal_number;
  }

 private:
  std::vector<std::string> target_command_;
  uint32_t cpu_limit_seconds_;
  uint64_t memory_limit_bytes_;
  uint32_t wall_limit_ms_;
  int expected_signal_;
};

}  // namespace symtools

#endif  // INCLUDE_SYMTOOLS_LIBSYMTOOLS_HPP_
