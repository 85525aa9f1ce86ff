#include <snipbox/process.h>

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <mutex>
#include <cstring>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include "utils.h"

namespace {

std::once_flag sigpipe_once;
const int kStatusFd = 3;

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) close(fds[i]);
    fds[i] = -1;
  }
}

std::vector<char*> ToCArgs(const std::vector<std::string>& strs) {
  std::vector<char*> ret;
  for (auto& i : strs) ret.push_back(const_cast<char*>(i.c_str()));
  ret.push_back(nullptr);
  return ret;
}

} // namespace

void IgnoreSigpipe() {
  std::call_once(sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });
}

std::string CommandResult::Message() const {
  std::string ret = Trim(err);
  if (ret.empty()) ret = Trim(out);
  if (ret.empty()) {
    if (timed_out) return "timed out";
    if (spawn_failed) return "could not be started";
    if (term_signal) return fmt::format("killed by signal {}", term_signal);
    return fmt::format("exit code {}", exit_code);
  }
  return ret;
}

CommandResult RunCommand(const std::vector<std::string>& argv, const CommandOptions& opt) {
  CommandResult ret;
  if (argv.empty()) {
    ret.spawn_failed = true;
    return ret;
  }
  IgnoreSigpipe();
  spdlog::debug("Run command {}", argv);

  int in[2] = {-1, -1}, out[2] = {-1, -1}, err[2] = {-1, -1}, status_pipe[2] = {-1, -1};
  if (pipe2(in, O_CLOEXEC) || pipe2(out, O_CLOEXEC) || pipe2(err, O_CLOEXEC) ||
      pipe2(status_pipe, O_CLOEXEC)) {
    spdlog::warn("Failed to create pipes for {}: {}", argv[0], strerror(errno));
    ClosePipe(in), ClosePipe(out), ClosePipe(err), ClosePipe(status_pipe);
    ret.spawn_failed = true;
    return ret;
  }
  auto c_argv = ToCArgs(argv);
  std::vector<char*> c_env;
  if (opt.env) c_env = ToCArgs(*opt.env);

  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed to fork for {}: {}", argv[0], strerror(errno));
    ClosePipe(in), ClosePipe(out), ClosePipe(err), ClosePipe(status_pipe);
    ret.spawn_failed = true;
    return ret;
  }
  if (pid == 0) {
    signal(SIGPIPE, SIG_DFL);
    dup2(in[0], 0);
    dup2(out[1], 1);
    dup2(err[1], 2);
    // only stdio and the status pipe (moved to fd 3) survive into the command
    if (status_pipe[1] != kStatusFd) {
      dup2(status_pipe[1], kStatusFd);
      fcntl(kStatusFd, F_SETFD, FD_CLOEXEC);
    }
    CloseFrom(kStatusFd + 1);
    if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) goto child_err;
    if (opt.env) {
      execvpe(c_argv[0], c_argv.data(), c_env.data());
    } else {
      execvp(c_argv[0], c_argv.data());
    }
child_err:
    {
      int code = errno;
      IGNORE_RETURN(write(kStatusFd, &code, sizeof(code)));
    }
    _exit(127);
  }
  close(in[0]);
  close(out[1]);
  close(err[1]);
  close(status_pipe[1]);

  auto deadline = opt.timeout_ms > 0 ?
      std::chrono::steady_clock::now() + std::chrono::milliseconds(opt.timeout_ms) :
      std::chrono::steady_clock::time_point::max();
  bool finished = PumpIo(in[1], opt.input, out[0], ret.out, err[0], ret.err,
                         opt.max_output, deadline);
  if (!finished) {
    spdlog::info("Command {} exceeded {} ms; killing", argv[0], opt.timeout_ms);
    kill(pid, SIGKILL);
    ret.timed_out = true;
  }
  close(out[0]);
  close(err[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  int exec_errno = 0;
  if (read(status_pipe[0], &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno)) {
    ret.spawn_failed = true;
    if (ret.err.empty()) ret.err = fmt::format("{}: {}", argv[0], strerror(exec_errno));
  }
  close(status_pipe[0]);
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.term_signal = WTERMSIG(status);
  }
  spdlog::debug("Command {} finished: exit {}, signal {}", argv[0], ret.exit_code, ret.term_signal);
  return ret;
}

bool CommandExists(const std::string& name) {
  if (name.find('/') != std::string::npos) return access(name.c_str(), X_OK) == 0;
  const char* path = getenv("PATH");
  if (!path) return false;
  for (auto& dir : Split(path, ':')) {
    if (dir.empty()) continue;
    if (access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}
