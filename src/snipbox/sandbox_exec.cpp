#include "sandbox_exec.h"

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <snipbox/paths.h>
#include "utils.h"

namespace {

void Inherit(int fd) {
  if (fd >= 0) fcntl(fd, F_SETFD, 0);
}

} // namespace

bool SandboxStart(const SandboxOptions& opt, SandboxHandle& handle) {
  IgnoreSigpipe();
  auto cmd = SandboxExecPath();
  auto vec = opt.Serialize();
  long size = vec.size();
  int inpipe[2], outpipe[2];
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    goto err;
  }
  handle.pid = fork();
  if (handle.pid < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    close(outpipe[0]);
    close(outpipe[1]);
    goto err;
  }
  if (handle.pid == 0) {
    signal(SIGPIPE, SIG_DFL);
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    Inherit(opt.fd_input);
    Inherit(opt.fd_output);
    Inherit(opt.fd_error);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  spdlog::debug("cjail_exec pid={} childpid={} workdir={} command={}",
      getpid(), handle.pid, opt.workdir, opt.command);
  close(inpipe[1]);
  close(outpipe[0]);
  if (!WriteAll(outpipe[1], (const char*)&size, sizeof(size)) ||
      !WriteAll(outpipe[1], (const char*)vec.data(), vec.size())) {
    int saved = errno;
    close(outpipe[1]);
    close(inpipe[0]);
    kill(handle.pid, SIGKILL);
    waitpid(handle.pid, nullptr, 0);
    handle.pid = -1;
    errno = saved;
    goto err;
  }
  close(outpipe[1]);
  handle.result_fd = inpipe[0];
  return true;
err:
  spdlog::warn("SandboxStart error: errno={} {}", errno, strerror(errno));
  return false;
}

struct cjail_result SandboxWait(SandboxHandle& handle) {
  struct cjail_result ret = {};
  std::string buf;
  bool read_ok = handle.result_fd >= 0 && ReadAll(handle.result_fd, buf);
  if (handle.result_fd >= 0) close(handle.result_fd);
  handle.result_fd = -1;
  if (handle.pid > 0) {
    while (waitpid(handle.pid, nullptr, 0) < 0 && errno == EINTR);
    handle.pid = -1;
  }
  if (!read_ok || buf.size() != sizeof(ret)) {
    spdlog::warn("sandbox-exec returned {} bytes instead of a result", buf.size());
    ret.oomkill = read_ok ? EPROTO : errno;
    ret.timekill = -1;
    return ret;
  }
  memcpy(&ret, buf.data(), sizeof(ret));
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
}
