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


#include "source/reduce/crash_oracle.h"

#include <signal.h>

#include <chrono>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/reduce/reduce_test_util.h"

namespace symtools {
namespace reduce {
namespace {

using ::testing::HasSubstr;

// A target that reads one line and kills itself with SIGSEGV if it contains
// "boom", or with SIGABRT if it contains "abrt".  Anything else exits with
// the length of the line.
const char kCrashingScript[] =
    "read line; "
    "case \"$line\" in "
    "*boom*) kill -SEGV $$ ;; "
    "*abrt*) kill -ABRT $$ ;; "
    "esac; "
    "exit ${#line}";

OracleOptions ShellTarget(const std::string& script) {
  OracleOptions options;
  options.SetTargetCommand({"/bin/sh", "-c", script});
  return options;
}

TEST(CrashOracleTest, DefaultOptions) {
  OracleOptions options;
  ASSERT_EQ(1u, options.GetTargetCommand().size());
  EXPECT_EQ("c++filt", options.GetTargetCommand()[0]);
  EXPECT_EQ(1u, options.GetCpuLimitSeconds());
  EXPECT_EQ(256u << 20, options.GetMemoryLimitBytes());
  EXPECT_EQ(10000u, options.GetWallLimitMs());
  EXPECT_EQ(0, options.GetExpectedSignal());
}

TEST(CrashOracleTest, ExecuteReportsOutcome) {
  CrashOracle oracle(ShellTarget(kCrashingScript));

  ExecutionResult crash = oracle.Execute("xxboomxx");
  EXPECT_TRUE(crash.launched);
  EXPECT_TRUE(crash.signaled);
  EXPECT_EQ(SIGSEGV, crash.signal_number);
  EXPECT_FALSE(crash.timed_out);

  ExecutionResult exit = oracle.Execute("fine");
  EXPECT_TRUE(exit.launched);
  EXPECT_FALSE(exit.signaled);
  EXPECT_EQ(4, exit.exit_code);

  EXPECT_EQ(2u, oracle.GetInvocationCount());
  EXPECT_FALSE(oracle.HasFailed());
}

TEST(CrashOracleTest, VerifyAcceptsAnySignalByDefault) {
  CrashOracle oracle(ShellTarget(kCrashingScript));
  EXPECT_TRUE(oracle.Verify("boom"));
  EXPECT_TRUE(oracle.Verify("abrt"));
  EXPECT_FALSE(oracle.Verify("fine"));
  EXPECT_FALSE(oracle.Verify(""));
  EXPECT_FALSE(oracle.HasFailed());
}

TEST(CrashOracleTest, VerifyMatchesExpectedSignal) {
  CrashOracle oracle(ShellTarget(kCrashingScript));
  oracle.SetExpectedSignal(SIGSEGV);
  EXPECT_TRUE(oracle.Verify("boom"));
  EXPECT_FALSE(oracle.Verify("abrt"));
}

TEST(CrashOracleTest, TargetThatIgnoresInput) {
  CrashOracle oracle(ShellTarget("kill -SEGV $$"));
  EXPECT_TRUE(oracle.Verify(std::string(1 << 20, 'x')));
}

TEST(CrashOracleTest, WatchdogKillsHangingTarget) {
  OracleOptions options = ShellTarget("read line; while :; do :; done");
  options.SetCpuLimitSeconds(0);
  options.SetWallLimitMs(200);
  CrashOracle oracle(options);

  ExecutionResult result = oracle.Execute("boom");
  EXPECT_TRUE(result.launched);
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(oracle.Verify("boom"));
  EXPECT_FALSE(oracle.HasFailed());
}

TEST(CrashOracleTest, WatchdogCoversTargetThatStopsReading) {
  // The candidate does not fit into the pipe buffer, and the target never
  // reads it.
  OracleOptions options;
  options.SetTargetCommand({"sleep", "30"});
  options.SetWallLimitMs(500);
  CrashOracle oracle(options);

  const auto start = std::chrono::steady_clock::now();
  ExecutionResult result = oracle.Execute(std::string(200000, 'a'));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.launched);
  EXPECT_TRUE(result.timed_out);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
  EXPECT_FALSE(oracle.Verify(std::string(200000, 'a')));
  EXPECT_FALSE(oracle.HasFailed());
}

TEST(CrashOracleTest, CpuLimitEndsRunawayTarget) {
  OracleOptions options = ShellTarget("read line; while :; do :; done");
  options.SetCpuLimitSeconds(1);
  CrashOracle oracle(options);

  ExecutionResult result = oracle.Execute("boom");
  EXPECT_TRUE(result.launched);
  EXPECT_FALSE(result.timed_out);
  EXPECT_TRUE(result.signaled);
  // The soft and the hard limit coincide, so the kernel may pick either.
  EXPECT_TRUE(result.signal_number == SIGXCPU ||
              result.signal_number == SIGKILL)
      << result.signal_number;
}

TEST(CrashOracleTest, LaunchFailureIsSticky) {
  OracleOptions options;
  options.SetTargetCommand({"/nonexistent/symtools-target"});
  CrashOracle oracle(options);
  std::vector<RecordedMessage> messages;
  oracle.SetMessageConsumer(MakeRecordingConsumer(&messages));

  EXPECT_FALSE(oracle.Verify("boom"));
  EXPECT_TRUE(oracle.HasFailed());
  EXPECT_FALSE(oracle.Verify("boom"));
  EXPECT_EQ(1u, oracle.GetInvocationCount());

  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(MessageLevel::Error, messages[0].level);
  EXPECT_EQ("CrashOracle", messages[0].source);
  EXPECT_THAT(messages[0].message,
              HasSubstr("could not launch '/nonexistent/symtools-target'"));
}

TEST(CrashOracleTest, ExecuteReportsLaunchFailure) {
  OracleOptions options;
  options.SetTargetCommand({"/nonexistent/symtools-target"});
  CrashOracle oracle(options);
  oracle.SetMessageConsumer(NopDiagnostic);

  ExecutionResult result = oracle.Execute("boom");
  EXPECT_FALSE(result.launched);
  EXPECT_FALSE(oracle.HasFailed());
}

TEST(CrashOracleTest, EmptyCommandIsAnError) {
  OracleOptions options;
  options.SetTargetCommand({});
  CrashOracle oracle(options);
  std::vector<RecordedMessage> messages;
  oracle.SetMessageConsumer(MakeRecordingConsumer(&messages));

  EXPECT_FALSE(oracle.Verify("boom"));
  EXPECT_TRUE(oracle.HasFailed());
  EXPECT_EQ(0u, oracle.GetInvocationCount());
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ(MessageLevel::Error, messages[0].level);
}

}  // namespace
}  // namespace reduce
}  // namespace symtools
