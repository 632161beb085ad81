#include "subprocess.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace walship::runtime {

using observability::IntField;
using observability::StringField;

std::vector<std::string> SplitCommandLine(const std::string& line) {
  std::vector<std::string> out;
  std::string              word;
  bool                     in_word = false;
  char                     quote   = 0;

  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];

    if (quote == '\'') {
      if (c == '\'') {
        quote = 0;
      } else {
        word.push_back(c);
      }
      continue;
    }

    if (c == '\\' && quote != '\'') {
      if (i + 1 >= line.size()) {
        throw util::InvalidArgument("trailing backslash in command line");
      }
      word.push_back(line[++i]);
      in_word = true;
      continue;
    }

    if (quote == '"') {
      if (c == '"') {
        quote = 0;
      } else {
        word.push_back(c);
      }
      continue;
    }

    if (c == '\'' || c == '"') {
      quote   = c;
      in_word = true;
    } else if (c == ' ' || c == '\t' || c == '\n') {
      if (in_word) {
        out.push_back(std::move(word));
        word.clear();
        in_word = false;
      }
    } else {
      word.push_back(c);
      in_word = true;
    }
  }

  if (quote != 0) {
    throw util::InvalidArgument("unterminated quote in command line");
  }
  if (in_word) out.push_back(std::move(word));
  return out;
}

Subprocess::Subprocess(std::vector<std::string> argv) : argv_(std::move(argv)) {
  if (argv_.empty()) {
    throw util::InvalidArgument("empty command");
  }
}

Subprocess::~Subprocess() {
  if (pid_ > 0 && !done_.IsFired()) {
    Terminate();
  }
  if (waiter_.joinable()) waiter_.join();
}

void Subprocess::Start() {
  std::vector<char*> args;
  args.reserve(argv_.size() + 1);
  for (auto& arg : argv_) args.push_back(arg.data());
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    throw std::runtime_error(std::string("fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    execvp(args[0], args.data());
    _exit(127);
  }

  pid_    = pid;
  waiter_ = std::thread(&Subprocess::Wait, this);
  WALSHIP_LOG_INFO("subprocess started", {StringField("command", argv_.front()), IntField("pid", pid_)});
}

void Subprocess::Wait() {
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      WALSHIP_LOG_ERROR("waitpid failed", {IntField("pid", pid_), StringField("error", std::strerror(errno))});
      exit_code_ = -1;
      done_.Fire();
      return;
    }
  }

  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }

  WALSHIP_LOG_INFO("subprocess exited", {IntField("pid", pid_), IntField("exit_code", exit_code_)});
  done_.Fire();
}

void Subprocess::Terminate(util::Duration grace) {
  if (pid_ <= 0) return;

  if (!done_.IsFired()) {
    kill(pid_, SIGTERM);
    if (!done_.WaitFor(grace)) {
      WALSHIP_LOG_WARN("subprocess ignored SIGTERM, killing", {IntField("pid", pid_)});
      kill(pid_, SIGKILL);
    }
  }

  if (waiter_.joinable()) waiter_.join();
}

} // namespace walship::runtime
