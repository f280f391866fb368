// Copyright 2024 The Sandpiper Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "./sandpiper/subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <future>  // NOLINT(build/c++11)
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./sandpiper/logging.h"

extern char **environ;

namespace sandpiper {

TerminationStatus::TerminationStatus(int status) : status_(status) {}

bool TerminationStatus::Exited() const { return WIFEXITED(status_); }

bool TerminationStatus::Signaled() const { return WIFSIGNALED(status_); }

int TerminationStatus::exit_code() const {
  CHECK(Exited()) << *this;
  return WEXITSTATUS(status_);
}

int TerminationStatus::signal() const {
  CHECK(Signaled()) << *this;
  return WTERMSIG(status_);
}

std::variant<ExitCodeT, SignalT> TerminationStatus::Status() const {
  if (Exited()) return static_cast<ExitCodeT>(WEXITSTATUS(status_));
  CHECK(Signaled()) << "!Exited && !Signaled";
  return static_cast<SignalT>(WTERMSIG(status_));
}

namespace {

bool ShouldRetry(int e) {
  return ((e == EINTR) || (e == EAGAIN) || (e == EWOULDBLOCK));
}

// Returns `VAR=value` strings for the current environment with `overrides`
// applied.
std::vector<std::string> MergedEnvironment(
    const absl::flat_hash_map<std::string, std::string> &overrides) {
  std::vector<std::string> result;
  for (char **var = environ; *var != nullptr; ++var) {
    const absl::string_view entry = *var;
    const absl::string_view name = entry.substr(0, entry.find('='));
    if (overrides.contains(name)) continue;
    result.emplace_back(entry);
  }
  for (const auto &[name, value] : overrides) {
    result.push_back(absl::StrCat(name, "=", value));
  }
  return result;
}

std::vector<char *> AsNullTerminatedArray(std::vector<std::string> &strings) {
  std::vector<char *> result;
  result.reserve(strings.size() + 1);
  for (std::string &str : strings) result.push_back(str.data());
  result.push_back(nullptr);
  return result;
}

int Wait(pid_t pid) {
  int status;
  while (true) {
    pid_t ret = waitpid(pid, &status, 0);
    if (ret == -1 && ShouldRetry(errno)) {
      continue;
    } else if (ret == pid && (WIFEXITED(status) || WIFSIGNALED(status))) {
      return status;
    } else {
      LOG(FATAL) << "wait() error: " << strerror(errno);
    }
  }
}

struct WaitResult {
  int status;
  bool timed_out;
};

// Polls with a growing interval so that short runs are reaped quickly.
WaitResult WaitWithTimeout(pid_t pid, absl::Duration timeout) {
  int status;
  const absl::Time wait_until = absl::Now() + timeout;
  absl::Duration sleep_duration = absl::Microseconds(50);
  constexpr absl::Duration kMaxSleepDuration = absl::Milliseconds(20);
  while (true) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == -1 && ShouldRetry(errno)) {
      continue;
    } else if (ret == 0) {  // Still running.
      if (absl::Now() > wait_until) {
        CHECK_EQ(kill(-pid, SIGKILL), 0)
            << "Cannot kill(): " << strerror(errno);
        return {Wait(pid), /*timed_out=*/true};
      }
      absl::SleepFor(sleep_duration);
      sleep_duration = std::min(sleep_duration * 2, kMaxSleepDuration);
    } else if (ret == pid && (WIFEXITED(status) || WIFSIGNALED(status))) {
      return {status, /*timed_out=*/false};
    } else {
      LOG(FATAL) << "wait() error: " << strerror(errno);
    }
  }
}

// Runs one command: spawns it with its stdout/stderr redirected into pipes,
// drains the pipes, and reaps it.
class SubProcess {
 public:
  SubProcess() = default;
  SubProcess(const SubProcess &) = delete;
  SubProcess &operator=(const SubProcess &) = delete;
  ~SubProcess();

  absl::StatusOr<RunResults> Run(
      const std::vector<std::string> &command_line,
      const absl::flat_hash_map<std::string, std::string> &environment,
      absl::Duration timeout);

 private:
  void CreatePipes();
  void CloseChildPipes();
  void CloseParentPipes();
  posix_spawn_file_actions_t CreateChildFileActions();
  absl::StatusOr<pid_t> StartChild(
      const std::vector<std::string> &command_line,
      const absl::flat_hash_map<std::string, std::string> &environment);
  void ReadChildOutput(std::string *stdout_output, std::string *stderr_output);

  // Pipe file descriptors pairs. Index 0 is for stdout, index 1 is for stderr.
  static constexpr int kStdOutIdx = 0;
  static constexpr int kStdErrIdx = 1;
  int parent_pipe_[2] = {-1, -1};
  int child_pipe_[2] = {-1, -1};
};

SubProcess::~SubProcess() {
  CloseChildPipes();
  CloseParentPipes();
}

void SubProcess::CreatePipes() {
  for (int channel : {kStdOutIdx, kStdErrIdx}) {
    int pipe_fds[2];
    CHECK_EQ(pipe2(pipe_fds, O_CLOEXEC), 0)
        << "Cannot create pipe: " << strerror(errno);
    parent_pipe_[channel] = pipe_fds[0];
    child_pipe_[channel] = pipe_fds[1];
    CHECK_NE(fcntl(parent_pipe_[channel], F_SETFL, O_NONBLOCK), -1)
        << "Cannot make pipe non-blocking: " << strerror(errno);
  }
}

void SubProcess::CloseChildPipes() {
  for (int channel : {kStdOutIdx, kStdErrIdx}) {
    if (child_pipe_[channel] == -1) continue;
    CHECK_NE(close(child_pipe_[channel]), -1)
        << "Cannot close pipe: " << strerror(errno);
    child_pipe_[channel] = -1;
  }
}

void SubProcess::CloseParentPipes() {
  for (int channel : {kStdOutIdx, kStdErrIdx}) {
    if (parent_pipe_[channel] == -1) continue;
    CHECK_NE(close(parent_pipe_[channel]), -1)
        << "Cannot close pipe: " << strerror(errno);
    parent_pipe_[channel] = -1;
  }
}

// File actions run in the child between the fork() and exec() steps.
posix_spawn_file_actions_t SubProcess::CreateChildFileActions() {
  posix_spawn_file_actions_t actions;
  int err = posix_spawn_file_actions_init(&actions);
  CHECK_EQ(err, 0) << "Cannot initialize file actions: " << strerror(err);

  err = posix_spawn_file_actions_addclose(&actions, STDIN_FILENO);
  CHECK_EQ(err, 0) << "Cannot add close() action: " << strerror(err);

  for (int channel : {kStdOutIdx, kStdErrIdx}) {
    // The pipes are O_CLOEXEC, so only the dup2()-ed copies survive exec().
    const int fd = channel == kStdOutIdx ? STDOUT_FILENO : STDERR_FILENO;
    err = posix_spawn_file_actions_adddup2(&actions, child_pipe_[channel], fd);
    CHECK_EQ(err, 0) << "Cannot add dup2() action: " << strerror(err);
  }
  return actions;
}

absl::StatusOr<pid_t> SubProcess::StartChild(
    const std::vector<std::string> &command_line,
    const absl::flat_hash_map<std::string, std::string> &environment) {
  if (command_line.empty()) {
    return absl::InvalidArgumentError("Empty command line");
  }
  std::vector<std::string> args = command_line;
  std::vector<char *> argv = AsNullTerminatedArray(args);
  std::vector<std::string> env = MergedEnvironment(environment);
  std::vector<char *> envp = AsNullTerminatedArray(env);

  posix_spawn_file_actions_t actions = CreateChildFileActions();
  // The child leads its own process group, so that a timeout can kill
  // everything it started.
  posix_spawnattr_t attr;
  CHECK_EQ(posix_spawnattr_init(&attr), 0);
  CHECK_EQ(posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP), 0);
  CHECK_EQ(posix_spawnattr_setpgroup(&attr, 0), 0);
  pid_t child_pid;
  const int err = posix_spawnp(&child_pid, argv[0], &actions, &attr,
                               argv.data(), envp.data());
  CHECK_EQ(posix_spawnattr_destroy(&attr), 0);
  CHECK_EQ(posix_spawn_file_actions_destroy(&actions), 0);
  if (err != 0) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Cannot spawn ", command_line[0], ": ", strerror(err)));
  }
  return child_pid;
}

void SubProcess::ReadChildOutput(std::string *stdout_output,
                                 std::string *stderr_output) {
  constexpr int kFdCount = 2;
  struct pollfd pfd[kFdCount];
  std::string *out_str[kFdCount];
  for (int channel : {kStdOutIdx, kStdErrIdx}) {
    pfd[channel].fd = parent_pipe_[channel];
    pfd[channel].events = POLLIN;
    pfd[channel].revents = 0;
    out_str[channel] = channel == kStdOutIdx ? stdout_output : stderr_output;
  }

  // A channel is done once its write end is closed by the child (and any of
  // its descendants that inherited it).
  int fd_remain = kFdCount;
  char buf[4096];
  while (fd_remain > 0) {
    int ret = poll(pfd, kFdCount, -1);
    if (ret == -1 && !ShouldRetry(errno)) {
      LOG(FATAL) << "Cannot poll(): " << strerror(errno);
    } else if (ret > 0) {
      for (int channel : {kStdOutIdx, kStdErrIdx}) {
        if ((pfd[channel].revents & (POLLIN | POLLHUP)) != 0) {
          ssize_t n = read(pfd[channel].fd, buf, sizeof(buf));
          if (n > 0) {
            out_str[channel]->append(buf, n);
          } else if (n == 0 || !ShouldRetry(errno)) {
            pfd[channel].fd = -1;  // poll() ignores negative fds.
            --fd_remain;
          }
        } else if ((pfd[channel].revents & (POLLERR | POLLNVAL)) != 0) {
          pfd[channel].fd = -1;
          --fd_remain;
        }
      }
    }
  }
}

absl::StatusOr<RunResults> SubProcess::Run(
    const std::vector<std::string> &command_line,
    const absl::flat_hash_map<std::string, std::string> &environment,
    absl::Duration timeout) {
  CreatePipes();
  absl::StatusOr<pid_t> child_pid = StartChild(command_line, environment);
  CloseChildPipes();
  if (!child_pid.ok()) return child_pid.status();
  std::future<WaitResult> wait_result =
      std::async(std::launch::async, &WaitWithTimeout, *child_pid, timeout);
  std::string stdout_output, stderr_output;
  ReadChildOutput(&stdout_output, &stderr_output);
  CloseParentPipes();
  const WaitResult result = wait_result.get();
  return RunResults{TerminationStatus(result.status), result.timed_out,
                    std::move(stdout_output), std::move(stderr_output)};
}

}  // namespace

absl::StatusOr<RunResults> RunCommand(
    const std::vector<std::string> &command_line,
    const absl::flat_hash_map<std::string, std::string> &environment,
    absl::Duration timeout) {
  SubProcess proc;
  return proc.Run(command_line, environment, timeout);
}

}  // namespace sandpiper
