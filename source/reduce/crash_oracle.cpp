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

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

namespace symtools {
namespace reduce {

namespace {

const int kLaunchFailedExitCode = 127;
const useconds_t kPollIntervalUs = 1000;

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

// Sets both the soft and the hard limit of |resource| to |value|.  Returns
// false on failure, with errno set.
bool SetLimit(int resource, rlim_t value) {
  struct rlimit limit;
  limit.rlim_cur = value;
  limit.rlim_max = value;
  return setrlimit(resource, &limit) == 0;
}

// Applies the resource limits of |options| to the calling process.  Runs in
// the child between fork() and exec().
bool ApplyLimits(const OracleOptions& options) {
  if (!SetLimit(RLIMIT_CORE, 0)) return false;
  if (options.GetCpuLimitSeconds() != 0 &&
      !SetLimit(RLIMIT_CPU, options.GetCpuLimitSeconds())) {
    return false;
  }
  if (options.GetMemoryLimitBytes() != 0 &&
      !SetLimit(RLIMIT_AS,
                static_cast<rlim_t>(options.GetMemoryLimitBytes()))) {
    return false;
  }
  return true;
}

// Points standard output and standard error of the calling process at
// /dev/null.  Runs in the child between fork() and exec().
bool DiscardOutput() {
  const int null_fd = open("/dev/null", O_WRONLY);
  if (null_fd < 0) return false;
  const bool ok = dup2(null_fd, STDOUT_FILENO) >= 0 &&
                  dup2(null_fd, STDERR_FILENO) >= 0;
  close(null_fd);
  return ok;
}

// Feeds |input| to the non-blocking pipe |*input_fd| while waiting for |pid|
// to terminate, and stores its status in |status|.  |*input_fd| is closed
// once all of |input| is written or the reader goes away; |input_complete|
// tells which.  Once |wall_limit_ms| milliseconds have passed the child is
// killed and |timed_out| is set; 0 means wait forever.  Returns false if
// waiting failed.
bool FeedAndWait(pid_t pid, uint32_t wall_limit_ms, const std::string& input,
                 int* input_fd, bool* input_complete, int* status,
                 bool* timed_out) {
  const auto start = std::chrono::steady_clock::now();
  bool deadline_active = wall_limit_ms != 0;
  size_t written = 0;
  for (;;) {
    bool progress = false;
    if (*input_fd >= 0) {
      if (written < input.size()) {
        const ssize_t n =
            write(*input_fd, input.data() + written, input.size() - written);
        if (n > 0) {
          written += static_cast<size_t>(n);
          progress = true;
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
                   errno != EINTR) {
          CloseFd(input_fd);
        }
      }
      if (*input_fd >= 0 && written == input.size()) {
        *input_complete = true;
        CloseFd(input_fd);
      }
    }

    const bool block = *input_fd < 0 && !deadline_active;
    const pid_t waited = waitpid(pid, status, block ? 0 : WNOHANG);
    if (waited == pid) return true;
    if (waited < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (deadline_active) {
      const auto elapsed =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - start)
              .count();
      if (elapsed > static_cast<long long>(wall_limit_ms)) {
        kill(pid, SIGKILL);
        *timed_out = true;
        deadline_active = false;
        CloseFd(input_fd);
        continue;
      }
    }
    if (!progress) usleep(kPollIntervalUs);
  }
}

}  // namespace

CrashOracle::CrashOracle(const OracleOptions& options)
    : options_(options),
      consumer_(IgnoreMessage),
      failed_(false),
      invocation_count_(0) {}

void CrashOracle::SetMessageConsumer(MessageConsumer consumer) {
  consumer_ = std::move(consumer);
}

void CrashOracle::SetExpectedSignal(int signal_number) {
  options_.SetExpectedSignal(signal_number);
}

void CrashOracle::ReportError(const std::string& message) {
  consumer_(MessageLevel::Error, "CrashOracle", message.c_str());
}

ExecutionResult CrashOracle::Execute(const std::string& candidate) {
  ExecutionResult result;

  const std::vector<std::string>& command = options_.GetTargetCommand();
  if (command.empty()) {
    ReportError("no target program given");
    return result;
  }
  std::vector<char*> argv;
  for (const auto& arg : command) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int input_pipe[2] = {-1, -1};
  if (pipe(input_pipe) != 0) {
    ReportError(std::string("could not create pipe: ") + strerror(errno));
    return result;
  }
  // Closed on a successful exec(); otherwise carries the errno of the failed
  // launch step back to the parent.
  int status_pipe[2] = {-1, -1};
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    ReportError(std::string("could not create pipe: ") + strerror(errno));
    CloseFd(&input_pipe[0]);
    CloseFd(&input_pipe[1]);
    return result;
  }

  ++invocation_count_;
  const pid_t pid = fork();
  if (pid < 0) {
    ReportError(std::string("could not fork: ") + strerror(errno));
    CloseFd(&input_pipe[0]);
    CloseFd(&input_pipe[1]);
    CloseFd(&status_pipe[0]);
    CloseFd(&status_pipe[1]);
    return result;
  }

  if (pid == 0) {
    close(input_pipe[1]);
    close(status_pipe[0]);
    if (dup2(input_pipe[0], STDIN_FILENO) >= 0 && DiscardOutput() &&
        ApplyLimits(options_)) {
      close(input_pipe[0]);
      execvp(argv[0], argv.data());
    }
    const int error = errno;
    // If this write fails the parent sees a plain exit with code 127.
    const ssize_t unused = write(status_pipe[1], &error, sizeof(error));
    (void)unused;
    _exit(kLaunchFailedExitCode);
  }

  CloseFd(&input_pipe[0]);
  CloseFd(&status_pipe[1]);

  int child_error = 0;
  ssize_t status_bytes;
  do {
    status_bytes = read(status_pipe[0], &child_error, sizeof(child_error));
  } while (status_bytes < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);

  if (status_bytes == static_cast<ssize_t>(sizeof(child_error))) {
    CloseFd(&input_pipe[1]);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    ReportError("could not launch '" + command[0] +
                "': " + strerror(child_error));
    return result;
  }

  // The target may exit without consuming its input; ignore SIGPIPE while
  // writing so that this shows up as a failed write instead.  The write end
  // is non-blocking so that the watchdog also covers a target that stops
  // reading.
  const int pipe_flags = fcntl(input_pipe[1], F_GETFL);
  if (pipe_flags < 0 ||
      fcntl(input_pipe[1], F_SETFL, pipe_flags | O_NONBLOCK) < 0) {
    ReportError(std::string("could not configure pipe: ") + strerror(errno));
    CloseFd(&input_pipe[1]);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return result;
  }
  struct sigaction ignore_action;
  memset(&ignore_action, 0, sizeof(ignore_action));
  ignore_action.sa_handler = SIG_IGN;
  sigemptyset(&ignore_action.sa_mask);
  struct sigaction previous_action;
  const bool restore_sigpipe =
      sigaction(SIGPIPE, &ignore_action, &previous_action) == 0;

  int status = 0;
  bool input_complete = false;
  const bool waited =
      FeedAndWait(pid, options_.GetWallLimitMs(), candidate + "\n",
                  &input_pipe[1], &input_complete, &status, &result.timed_out);
  const int wait_error = errno;
  CloseFd(&input_pipe[1]);
  if (restore_sigpipe) {
    sigaction(SIGPIPE, &previous_action, nullptr);
  }
  if (!waited) {
    ReportError(std::string("could not wait for target: ") +
                strerror(wait_error));
    return result;
  }
  if (!input_complete && !result.timed_out) {
    consumer_(MessageLevel::Debug, "CrashOracle",
              "target did not consume its whole input");
  }

  result.launched = true;
  if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.signal_number = WTERMSIG(status);
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

bool CrashOracle::Verify(const std::string& candidate) {
  if (failed_) {
    return false;
  }
  const ExecutionResult result = Execute(candidate);
  if (!result.launched) {
    failed_ = true;
    return false;
  }
  if (result.timed_out || !result.signaled) {
    return false;
  }
  return options_.GetExpectedSignal() == 0 ||
         result.signal_number == options_.GetExpectedSignal();
}

}  // namespace reduce
}  // namespace symtools
