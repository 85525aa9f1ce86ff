#include <snipbox/policy.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <snipbox/errors.h>
#include "utils.h"

namespace {

std::string Unquote(const std::string& str) {
  std::string ret = Trim(str);
  if (ret.size() >= 2 && (ret[0] == '"' || ret[0] == '\'') && ret.back() == ret[0]) {
    ret = ret.substr(1, ret.size() - 2);
  }
  return ret;
}

// comma-separated, or a JSON array of strings
Policy::Names ParseNames(const std::string& key, const std::string& value) {
  Policy::Names ret;
  std::string str = Trim(value);
  if (str.size() && str[0] == '[') {
    auto arr = nlohmann::json::parse(str, nullptr, false);
    if (arr.is_discarded() || !arr.is_array()) {
      throw ConfigError(fmt::format("{} must be a list of strings", key));
    }
    for (auto& i : arr) {
      if (!i.is_string()) throw ConfigError(fmt::format("{} must be a list of strings", key));
      if (auto name = Trim(i.get<std::string>()); name.size()) ret.insert(name);
    }
    return ret;
  }
  for (auto& i : Split(str, ',')) {
    if (auto name = Unquote(i); name.size()) ret.insert(name);
  }
  return ret;
}

long ParseLong(const std::string& key, const std::string& value) {
  std::string str = Unquote(value);
  size_t pos = 0;
  long ret = 0;
  try {
    ret = std::stol(str, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (!pos || pos != str.size()) throw ConfigError(fmt::format("{} must be an integer", key));
  return ret;
}

} // namespace

Policy Policy::FromFile(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) throw ConfigError(fmt::format("Cannot open policy file {}", path.string()));
  spdlog::debug("Loading policy from {}", path.string());
  tortellini::ini ini;
  fin >> ini;
  auto Get = [&ini](const char* key) -> std::string {
    std::string val = ini["policy"][key] | "";
    if (val.empty()) val = ini[""][key] | "";
    return val;
  };

  Policy ret;
  // lists absent from a file are empty, not the built-in defaults
  ret.blocked_imports.clear();
  ret.blocked_builtins.clear();
  if (auto mode = Get("mode"); mode.size() && !ParsePolicyMode(Unquote(mode), ret.mode)) {
    throw ConfigError("mode must be 'allow' or 'restrict'");
  }
  if (auto val = Get("timeout_seconds"); val.size()) {
    ret.timeout_seconds = ParseLong("timeout_seconds", val);
  }
  if (auto val = Get("memory_limit_mb"); val.size()) {
    ret.memory_limit_mb = ParseLong("memory_limit_mb", val);
  }
  if (auto val = Get("max_output_kb"); val.size()) {
    ret.max_output_kb = ParseLong("max_output_kb", val);
  }
  ret.allowed_imports = ParseNames("allowed_imports", Get("allowed_imports"));
  ret.blocked_imports = ParseNames("blocked_imports", Get("blocked_imports"));
  ret.allowed_builtins = ParseNames("allowed_builtins", Get("allowed_builtins"));
  ret.blocked_builtins = ParseNames("blocked_builtins", Get("blocked_builtins"));
  ret.allowed_globals = ParseNames("allowed_globals", Get("allowed_globals"));
  ret.blocked_globals = ParseNames("blocked_globals", Get("blocked_globals"));
  if (auto val = Trim(Get("extra_globals")); val.size()) {
    ret.extra_globals = nlohmann::json::parse(val, nullptr, false);
    if (ret.extra_globals.is_discarded() || !ret.extra_globals.is_object()) {
      throw ConfigError("extra_globals must be a JSON object");
    }
  }
  ret.config_path = path;
  ret.Validate();
  return ret;
}
