#include <snipbox/runner.h>

#include <spdlog/spdlog.h>
#include <snipbox/errors.h>
#include <snipbox/utils.h>

Policy ResolvePolicy(const std::optional<Policy>& policy,
                     const std::optional<std::filesystem::path>& policy_file) {
  if (policy && policy_file) throw ConfigError("Pass either a policy or a policy file, not both");
  if (policy_file) return Policy::FromFile(*policy_file);
  if (!policy) return Policy();
  if (policy->config_path) return Policy::FromFile(*policy->config_path);
  policy->Validate();
  return *policy;
}

ExecutionResult RunCode(const std::string& code, ExecutionEngine& engine,
                        const nlohmann::json& input_data, const std::optional<Policy>& policy,
                        const std::optional<std::filesystem::path>& policy_file) {
  if (!input_data.is_null() && !input_data.is_object()) {
    throw ConfigError("input_data must be a JSON object");
  }
  ExecutionRequest request;
  request.policy = ResolvePolicy(policy, policy_file);
  request.code = code;
  request.input_data = input_data.is_null() ? nlohmann::json::object() : input_data;

  spdlog::debug("Dispatching {} bytes of code to the {} engine (mode {}, timeout {}s)",
      code.size(), engine.Name(), PolicyModeName(request.policy.mode),
      request.policy.timeout_seconds);
  ExecutionOutcome outcome;
  try {
    outcome = engine.Execute(request);
  } catch (const ConfigError&) {
    throw;
  } catch (const std::exception& err) {
    spdlog::error("{} engine failed: {}", engine.Name(), err.what());
    outcome = ExecutionOutcome::Failure(err.what());
  }
  ExecutionResult result = InterpretOutcome(outcome, request.policy);
  if (result.ok) {
    spdlog::info("Snippet finished on {} engine", engine.Name());
  } else {
    spdlog::info("Snippet failed on {} engine: {} ({})", engine.Name(),
                 result.error.value_or(""), ErrorKindName(result.error_kind));
  }
  return result;
}
