#ifndef SNIPBOX_INTERPRETER_H_
#define SNIPBOX_INTERPRETER_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>
#include <snipbox/policy.h>
#include <snipbox/execution.h>

// What the worker reports back to the supervising engine
struct SnippetOutcome {
  bool ok;
  std::optional<nlohmann::json> result;
  std::string out, err;
  bool resource_exceeded;
  std::string error;
  ErrorKind error_kind;
  int exit_code;

  SnippetOutcome() :
      ok(false), resource_exceeded(false), error_kind(ErrorKind::NONE), exit_code(0) {}
  static SnippetOutcome Failure(std::string error, int exit_code = kExitInfrastructure);
  nlohmann::json ToJson() const;
};

// Executes one snippet in the embedded interpreter under the capability policy.
// Initializes the interpreter on the first call and never finalizes it: the worker
// process is single use. program is the interpreter the environment belongs to.
SnippetOutcome RunSnippet(const std::string& program, const std::string& code,
                          const nlohmann::json& input_data, const Policy& policy);

#endif  // SNIPBOX_INTERPRETER_H_
