#pragma once

#include <sys/types.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/one_shot.hpp"
#include "internal/util/time.hpp"

namespace walship::runtime {

// Splits a command line with shell word rules (single/double quotes, backslash).
// Throws util::InvalidArgument on an unterminated quote.
std::vector<std::string> SplitCommandLine(const std::string& line);

/*
  Child process started after the node is ready.

  Done() fires once the child exited; ExitCode() is valid from then on
  (128 + signal for a signalled child, 127 when exec failed).
*/
class Subprocess {
 public:
  explicit Subprocess(std::vector<std::string> argv);
  ~Subprocess();

  Subprocess(const Subprocess&)            = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  void Start();

  const util::OneShotSignal& Done() const {
    return done_;
  }

  int ExitCode() const {
    return exit_code_;
  }

  pid_t Pid() const {
    return pid_;
  }

  // SIGTERM, then SIGKILL once `grace` elapsed. Waits for the child.
  void Terminate(util::Duration grace = std::chrono::seconds(10));

 private:
  void Wait();

  std::vector<std::string> argv_;
  pid_t                    pid_ = -1;
  std::atomic<int>         exit_code_{-1};
  util::OneShotSignal      done_;
  std::thread              waiter_;
};

} // namespace walship::runtime
