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

#ifndef SANDPIPER_SUBPROCESS_H_
#define SANDPIPER_SUBPROCESS_H_

#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

namespace sandpiper {

enum class ExitCodeT : int;
inline ExitCodeT ExitCode(int i) { return static_cast<ExitCodeT>(i); }
inline std::ostream &operator<<(std::ostream &os, ExitCodeT code) {
  return os << "ExitCode: " << static_cast<int>(code);
}
enum class SignalT : int;
inline SignalT Signal(int i) { return static_cast<SignalT>(i); }
inline std::ostream &operator<<(std::ostream &os, SignalT code) {
  return os << "Signal: " << static_cast<int>(code);
}

// How a process ended.
class TerminationStatus {
  using StatusT = std::variant<ExitCodeT, SignalT>;

 public:
  // Constructs TerminationStatus from a raw `status` value as returned by
  // waitpid().
  explicit TerminationStatus(int status);
  // True iff the process exited (wasn't terminated by a signal).
  bool Exited() const;
  // True iff the process was terminated by a signal.
  bool Signaled() const;
  // The exit code. Requires `Exited()`.
  int exit_code() const;
  // The terminating signal. Requires `Signaled()`.
  int signal() const;

  friend std::ostream &operator<<(std::ostream &os, TerminationStatus self) {
    std::visit([&os](auto v) { os << v; }, self.Status());
    return os;
  }

  template <typename Sink>
  friend void AbslStringify(Sink &sink, const TerminationStatus self) {
    std::stringstream ss;
    ss << self;
    sink.Append(ss.str());
  }

  // TerminationStatus can be compared to ExitCodeT and SignalT.
  friend bool operator==(TerminationStatus self, StatusT res) {
    return self.Status() == res;
  }
  friend bool operator!=(TerminationStatus self, StatusT res) {
    return self.Status() != res;
  }

  // If Exited, returns an ExitCodeT. If Signaled, returns a SignalT.
  StatusT Status() const;

 private:
  int status_;
};

struct RunResults {
  TerminationStatus status;
  // True iff the process was killed because it ran past its timeout.
  bool timed_out = false;
  std::string stdout_output;
  std::string stderr_output;
};

// Runs `command_line` in a subprocess with closed stdin, capturing stdout and
// stderr. The subprocess inherits this process' environment, with the
// variables in `environment` added or overridden. If the process runs longer
// than `timeout`, its process group is killed with SIGKILL and `timed_out` is
// set.
//
// Returns an error if the process could not be started, e.g. because
// `command_line[0]` does not name an executable.
absl::StatusOr<RunResults> RunCommand(
    const std::vector<std::string> &command_line,
    const absl::flat_hash_map<std::string, std::string> &environment = {},
    absl::Duration timeout = absl::InfiniteDuration());

}  // namespace sandpiper

#endif  // SANDPIPER_SUBPROCESS_H_
