#ifndef SNIPBOX_SANDBOX_EXEC_H_
#define SNIPBOX_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox.h"

// Kept apart from sandbox.h, which is linked into the sandbox-exec helper as well

struct SandboxHandle {
  pid_t pid;
  int result_fd;

  SandboxHandle() : pid(-1), result_fd(-1) {}
};

// Forks the sandbox-exec helper and hands it the options. fd_input/fd_output/fd_error
// are inherited by the helper even if they are close-on-exec. The caller must drain
// the jailed process' pipes before SandboxWait.
bool SandboxStart(const SandboxOptions&, SandboxHandle&);
// On failure timekill is -1 and oomkill holds the errno
struct cjail_result SandboxWait(SandboxHandle&);

#endif  // SNIPBOX_SANDBOX_EXEC_H_
