#include "worker.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include "sandbox_exec.h"
#include "utils.h"

namespace {

// headroom for the interpreter on top of the snippet's own ceiling
const long kVssMarginMb = 64;
const long kFileSizeKib = 64 * 1024;
const int kFileNum = 256;
const int kNobody = 65534;
const int kNobodyProcNum = 64;
const auto kPumpGrace = std::chrono::seconds(5);
const size_t kMinResponseBytes = 1 << 20;

void CloseAll(std::initializer_list<int> fds) {
  for (int fd : fds) {
    if (fd >= 0) close(fd);
  }
}

} // namespace

ExecutionOutcome RunWorker(const WorkerLaunch& launch, const ExecutionRequest& request) {
  const Policy& policy = request.policy;
  int in[2], out[2], err[2];
  if (pipe2(in, O_CLOEXEC) < 0) {
    return ExecutionOutcome::Failure(fmt::format("Failed to create pipes: {}", strerror(errno)));
  }
  if (pipe2(out, O_CLOEXEC) < 0) {
    int saved = errno;
    CloseAll({in[0], in[1]});
    return ExecutionOutcome::Failure(fmt::format("Failed to create pipes: {}", strerror(saved)));
  }
  if (pipe2(err, O_CLOEXEC) < 0) {
    int saved = errno;
    CloseAll({in[0], in[1], out[0], out[1]});
    return ExecutionOutcome::Failure(fmt::format("Failed to create pipes: {}", strerror(saved)));
  }

  SandboxOptions opt;
  opt.command = launch.command;
  opt.envs = launch.envs;
  opt.workdir = launch.workdir;
  opt.fd_input = in[0];
  opt.fd_output = out[1];
  opt.fd_error = err[1];
  opt.uid = launch.uid;
  opt.gid = launch.gid;
  opt.wall_time = policy.timeout_seconds * 1'000'000;
  opt.vss = (policy.memory_limit_mb + kVssMarginMb) * 1024;
  opt.rss = opt.vss;
  opt.file_num = kFileNum;
  opt.fsize = kFileSizeKib;
  // RLIMIT_NPROC counts every process of the uid
  if (launch.uid == kNobody) opt.proc_num = kNobodyProcNum;

  SandboxHandle handle;
  if (!SandboxStart(opt, handle)) {
    int saved = errno;
    CloseAll({in[0], in[1], out[0], out[1], err[0], err[1]});
    return ExecutionOutcome::Failure(fmt::format("Failed to start sandbox: {}", strerror(saved)));
  }
  CloseAll({in[0], out[1], err[1]});

  ExecutionOutcome ret;
  // the response carries stdout, stderr and the result
  size_t max_response = std::max<size_t>(policy.MaxOutputBytes() * 4, kMinResponseBytes);
  auto deadline = std::chrono::steady_clock::now() +
      std::chrono::seconds(policy.timeout_seconds) + kPumpGrace;
  bool drained = PumpIo(in[1], request.SerializedPayload(), out[0], ret.response,
                        err[0], ret.diagnostics, max_response, deadline);
  CloseAll({out[0], err[0]});
  if (!drained) spdlog::warn("Worker pipes still open after the wall time; abandoning them");

  struct cjail_result res = SandboxWait(handle);
  if (res.timekill == -1) {
    return ExecutionOutcome::Failure(fmt::format("Sandbox error: {}", strerror(res.oomkill)));
  }
  spdlog::debug("Worker finished: timekill={} oomkill={} code={} status={} hiwater_vm={}",
      res.timekill, res.oomkill, res.info.si_code, res.info.si_status, res.stats.hiwater_vm);
  if (res.timekill) ret.timed_out = true;
  if (res.oomkill) ret.resource_exceeded = true;
  if (res.info.si_code == CLD_EXITED) {
    ret.exit_code = res.info.si_status;
  } else {
    ret.term_signal = res.info.si_status;
  }
  return ret;
}
