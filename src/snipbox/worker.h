#ifndef SNIPBOX_WORKER_H_
#define SNIPBOX_WORKER_H_

#include <string>
#include <vector>

#include <snipbox/execution.h>

struct WorkerLaunch {
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir;
  int uid, gid;
};

// Runs one worker process under cjail and collects its response. Timeouts,
// memory kills and sandbox failures are reported in the outcome.
ExecutionOutcome RunWorker(const WorkerLaunch&, const ExecutionRequest&);

#endif  // SNIPBOX_WORKER_H_
