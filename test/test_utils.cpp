#include "test_utils.h"

#include <unistd.h>
#include <fstream>

#include <snipbox/process.h>

ExecutionResult RunWorkerDirect(const std::string& code, const Policy& policy,
                                const nlohmann::json& input_data) {
  ExecutionRequest request;
  request.code = code;
  request.input_data = input_data;
  request.policy = policy;
  CommandOptions opt;
  opt.input = request.SerializedPayload();
  opt.timeout_ms = policy.timeout_seconds * 1000;
  CommandResult res = RunCommand({WorkerPath().string()}, opt);

  ExecutionOutcome outcome;
  outcome.timed_out = res.timed_out;
  outcome.response = res.out;
  outcome.diagnostics = res.err;
  if (res.term_signal) {
    outcome.term_signal = res.term_signal;
  } else {
    outcome.exit_code = res.exit_code;
  }
  return InterpretOutcome(outcome, policy);
}

TempFile::TempFile(const std::string& content, const std::string& suffix) {
  static int seq = 0;
  path_ = fs::temp_directory_path() /
      ("snipbox_test_" + std::to_string(getpid()) + "_" + std::to_string(seq++) + suffix);
  std::ofstream fout(path_);
  fout << content;
}

TempFile::~TempFile() {
  std::error_code ec;
  fs::remove(path_, ec);
}

std::string OkResponse(const nlohmann::json& result) {
  return nlohmann::json{
    {"ok", true}, {"result", result}, {"stdout", ""}, {"stderr", ""},
    {"resource_exceeded", false}, {"error", nullptr}, {"error_kind", "none"}, {"exit_code", 0},
  }.dump();
}
