#ifndef INCLUDE_SNIPBOX_EXECUTION_H_
#define INCLUDE_SNIPBOX_EXECUTION_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>
#include "policy.h"

#define ENUM_ERROR_KIND_ \
  X(NONE, "none") \
  X(POLICY_VIOLATION, "policy_violation") \
  X(RUNTIME_ERROR, "runtime_error") /* uncaught exception or syntax error */ \
  X(EXIT_NONZERO, "exit_nonzero") \
  X(TIMEOUT, "timeout") \
  X(RESOURCE_EXCEEDED, "resource_exceeded") \
  X(INFRASTRUCTURE, "infrastructure") /* daemon, image, sandbox or environment failure */
enum class ErrorKind {
#define X(name, str) name,
  ENUM_ERROR_KIND_
#undef X
};

constexpr int kExitTimeout = 124;
constexpr int kExitInfrastructure = 125;
constexpr int kExitMemory = 2;

struct ExecutionRequest {
  std::string code;
  nlohmann::json input_data; // object
  Policy policy;

  // what the worker reads on its stdin
  nlohmann::json Payload() const;
  std::string SerializedPayload() const;
};

// Raw engine output; converted into ExecutionResult by InterpretOutcome
struct ExecutionOutcome {
  std::string response; // JSON document written by the worker
  std::string diagnostics; // stderr of the worker process itself
  std::optional<int> exit_code; // unset if terminated by a signal
  int term_signal;
  bool timed_out;
  bool resource_exceeded;
  std::string error; // infrastructure failure; empty if none

  ExecutionOutcome() : term_signal(0), timed_out(false), resource_exceeded(false) {}
  static ExecutionOutcome Failure(std::string error, int exit_code = kExitInfrastructure);
};

class ExecutionResult {
 public:
  // true iff the worker exited 0 without policy violation, timeout or memory overrun
  bool ok;
  std::optional<nlohmann::json> result; // unset if the snippet never bound `result`
  std::string stdout_text, stderr_text; // capped at max_output_kb
  bool timed_out;
  bool resource_exceeded;
  std::optional<std::string> error; // set iff !ok
  std::optional<int> exit_code;
  ErrorKind error_kind;

  ExecutionResult() :
      ok(false), timed_out(false), resource_exceeded(false), error_kind(ErrorKind::NONE) {}

  nlohmann::json ToJson() const;
};

ExecutionResult InterpretOutcome(const ExecutionOutcome&, const Policy&);

#endif  // INCLUDE_SNIPBOX_EXECUTION_H_
