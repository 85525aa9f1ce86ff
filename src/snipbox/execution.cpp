#include <snipbox/execution.h>

#include <csignal>
#include <cstring>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

const char kInvalidResponse[] = "Worker returned invalid JSON";

std::string StringField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

bool BoolField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_boolean() && it->get<bool>();
}

ExecutionResult Failed(ErrorKind kind, std::string error, std::optional<int> exit_code) {
  ExecutionResult ret;
  ret.error_kind = kind;
  ret.error = std::move(error);
  ret.exit_code = exit_code;
  return ret;
}

} // namespace

nlohmann::json ExecutionRequest::Payload() const {
  return {
    {"code", code},
    {"input_data", input_data.is_null() ? nlohmann::json::object() : input_data},
    {"policy", policy.ToJson()},
  };
}

std::string ExecutionRequest::SerializedPayload() const {
  return Payload().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ExecutionOutcome ExecutionOutcome::Failure(std::string error, int exit_code) {
  ExecutionOutcome ret;
  ret.error = std::move(error);
  ret.exit_code = exit_code;
  return ret;
}

nlohmann::json ExecutionResult::ToJson() const {
  nlohmann::json ret = {
    {"ok", ok},
    {"result", result ? *result : nlohmann::json()},
    {"stdout", stdout_text},
    {"stderr", stderr_text},
    {"timed_out", timed_out},
    {"resource_exceeded", resource_exceeded},
    {"error", error ? nlohmann::json(*error) : nlohmann::json()},
    {"exit_code", exit_code ? nlohmann::json(*exit_code) : nlohmann::json()},
    {"error_kind", ErrorKindName(error_kind)},
  };
  return ret;
}

ExecutionResult InterpretOutcome(const ExecutionOutcome& outcome, const Policy& policy) {
  const size_t max_output = policy.MaxOutputBytes();
  if (outcome.timed_out) {
    ExecutionResult ret = Failed(ErrorKind::TIMEOUT,
        fmt::format("Execution timed out after {}s", policy.timeout_seconds), kExitTimeout);
    ret.timed_out = true;
    return ret;
  }

  if (Trim(outcome.response).empty()) {
    ExecutionResult ret;
    if (outcome.resource_exceeded) {
      ret = Failed(ErrorKind::RESOURCE_EXCEEDED, "Memory limit exceeded",
                   outcome.exit_code.value_or(kExitMemory));
      ret.resource_exceeded = true;
    } else if (outcome.error.size()) {
      ret = Failed(ErrorKind::INFRASTRUCTURE, outcome.error,
                   outcome.exit_code.value_or(kExitInfrastructure));
    } else if (outcome.term_signal) {
      ret = Failed(ErrorKind::RUNTIME_ERROR, fmt::format("Worker terminated by signal {} ({})",
          outcome.term_signal, strsignal(outcome.term_signal)), std::nullopt);
    } else {
      ret = Failed(ErrorKind::INFRASTRUCTURE, fmt::format("Worker produced no output (exit code {})",
          outcome.exit_code ? std::to_string(*outcome.exit_code) : "unknown"), outcome.exit_code);
    }
    ret.stderr_text = TruncateUtf8(outcome.diagnostics, max_output);
    return ret;
  }

  auto resp = nlohmann::json::parse(outcome.response, nullptr, false);
  if (resp.is_discarded() || !resp.is_object()) {
    spdlog::warn("Unparsable worker response ({} bytes)", outcome.response.size());
    ExecutionResult ret = Failed(ErrorKind::INFRASTRUCTURE, kInvalidResponse,
                                 outcome.exit_code.value_or(kExitInfrastructure));
    ret.stderr_text = TruncateUtf8(outcome.diagnostics, max_output);
    return ret;
  }

  ExecutionResult ret;
  if (auto it = resp.find("result"); it != resp.end()) ret.result = *it;
  ret.stdout_text = TruncateUtf8(StringField(resp, "stdout"), max_output);
  ret.stderr_text = StringField(resp, "stderr");
  if (ret.stderr_text.empty()) ret.stderr_text = outcome.diagnostics;
  ret.stderr_text = TruncateUtf8(ret.stderr_text, max_output);
  ret.resource_exceeded = BoolField(resp, "resource_exceeded") || outcome.resource_exceeded;
  // the response carries the unmasked exit code; the process status is masked to 8 bits
  const bool process_ok = !outcome.exit_code || *outcome.exit_code == 0;
  ret.exit_code = outcome.exit_code;
  if (auto it = resp.find("exit_code"); it != resp.end() && it->is_number_integer()) {
    int code = it->get<int>();
    if (code || process_ok) ret.exit_code = code;
  }
  ErrorKind kind = ErrorKind::NONE;
  ParseErrorKind(StringField(resp, "error_kind"), kind);
  std::string error = StringField(resp, "error");

  ret.ok = BoolField(resp, "ok") && ret.exit_code == 0 && process_ok && !ret.resource_exceeded &&
      kind == ErrorKind::NONE;
  if (ret.ok) {
    ret.error_kind = ErrorKind::NONE;
    return ret;
  }
  if (ret.resource_exceeded) {
    kind = ErrorKind::RESOURCE_EXCEEDED;
    if (error.empty()) error = "Memory limit exceeded";
  }
  if (kind == ErrorKind::NONE) {
    kind = ret.exit_code && *ret.exit_code ? ErrorKind::EXIT_NONZERO : ErrorKind::RUNTIME_ERROR;
  }
  if (error.empty()) {
    if (outcome.error.size()) {
      error = outcome.error;
    } else if (ret.exit_code) {
      error = fmt::format("Worker exited with code {}", *ret.exit_code);
    } else {
      error = "Execution failed";
    }
  }
  ret.error_kind = kind;
  ret.error = error;
  return ret;
}
