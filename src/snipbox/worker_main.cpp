#include <fcntl.h>
#include <unistd.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <snipbox/errors.h>
#include <snipbox/paths.h>
#include "interpreter.h"
#include "utils.h"

// Reads {code, input_data, policy} on stdin and writes one JSON response on the
// original stdout. fd 1 is pointed at /dev/null first, so native writes from the
// snippet cannot reach the response channel.
namespace {

int TakeResponseChannel() {
  int fd = fcntl(1, F_DUPFD_CLOEXEC, 3);
  if (fd < 0) return -1;
  int devnull = open("/dev/null", O_WRONLY);
  if (devnull < 0 || dup2(devnull, 1) < 0) {
    if (devnull >= 0) close(devnull);
    close(fd);
    return -1;
  }
  close(devnull);
  return fd;
}

SnippetOutcome Run(const std::string& program) {
  std::string input;
  if (!ReadAll(0, input)) {
    return SnippetOutcome::Failure(fmt::format("Failed to read request: {}", strerror(errno)));
  }
  auto request = nlohmann::json::parse(input, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    return SnippetOutcome::Failure("Malformed worker request");
  }
  auto code = request.find("code");
  if (code == request.end() || !code->is_string()) {
    return SnippetOutcome::Failure("Worker request carries no code");
  }
  Policy policy;
  try {
    policy = Policy::FromJson(request.value("policy", nlohmann::json::object()));
  } catch (const ConfigError& err) {
    return SnippetOutcome::Failure(fmt::format("Invalid policy: {}", err.what()));
  }
  nlohmann::json input_data = nlohmann::json::object();
  if (auto it = request.find("input_data"); it != request.end() && it->is_object()) {
    input_data = *it;
  }
  return RunSnippet(program, code->get<std::string>(), input_data, policy);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_st("snipbox-worker"));
  spdlog::set_level(spdlog::level::warn);
  std::string program = kPythonExecutable;
  for (int i = 1; i < argc; i++) {
    if (!strcmp(argv[i], "--python") && i + 1 < argc) {
      program = argv[++i];
    } else if (!strcmp(argv[i], "-v")) {
      spdlog::set_level(spdlog::level::debug);
    }
  }

  int response_fd = TakeResponseChannel();
  if (response_fd < 0) {
    spdlog::error("Cannot set up the response channel: {}", strerror(errno));
    _exit(kExitInfrastructure);
  }
  SnippetOutcome outcome = Run(program);
  std::string response = outcome.ToJson().dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace);
  response += '\n';
  if (!WriteAll(response_fd, response.data(), response.size())) {
    spdlog::error("Failed to write response: {}", strerror(errno));
    _exit(kExitInfrastructure);
  }
  // the interpreter is never finalized
  int status = outcome.exit_code & 0xff;
  if (!status && !outcome.ok) status = 1;
  _exit(status);
}
