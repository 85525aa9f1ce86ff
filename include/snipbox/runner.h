#ifndef INCLUDE_SNIPBOX_RUNNER_H_
#define INCLUDE_SNIPBOX_RUNNER_H_

#include <string>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "engine.h"

// At most one of policy / policy_file; neither means the default Policy.
// Throws ConfigError on conflicting or invalid configuration; everything else is
// reported through the returned result.
Policy ResolvePolicy(const std::optional<Policy>& policy,
                     const std::optional<std::filesystem::path>& policy_file);

ExecutionResult RunCode(
    const std::string& code, ExecutionEngine& engine,
    const nlohmann::json& input_data = nlohmann::json::object(),
    const std::optional<Policy>& policy = std::nullopt,
    const std::optional<std::filesystem::path>& policy_file = std::nullopt);

#endif  // INCLUDE_SNIPBOX_RUNNER_H_
