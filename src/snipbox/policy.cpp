#include <snipbox/policy.h>

#include <spdlog/fmt/fmt.h>
#include <snipbox/errors.h>
#include "utils.h"

const char kDynamicImportModule[] = "importlib";
const std::set<std::string> kReflectionBuiltins = {"__loader__", "__spec__"};

namespace {

const long kDefaultTimeout = 5;
const long kDefaultMemoryMb = 256;
const long kDefaultMaxOutputKb = 128;

nlohmann::json NamesToJson(const Policy::Names& names) {
  return nlohmann::json(std::vector<std::string>(names.begin(), names.end()));
}

Policy::Names NamesFromJson(const nlohmann::json& obj, const char* key, const Policy::Names& def) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return def;
  if (!it->is_array()) throw ConfigError(fmt::format("{} must be a list of strings", key));
  Policy::Names ret;
  for (auto& i : *it) {
    if (!i.is_string()) throw ConfigError(fmt::format("{} must be a list of strings", key));
    std::string name = Trim(i.get<std::string>());
    if (name.size()) ret.insert(name);
  }
  return ret;
}

long LongFromJson(const nlohmann::json& obj, const char* key, long def) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return def;
  if (!it->is_number_integer()) throw ConfigError(fmt::format("{} must be an integer", key));
  return it->get<long>();
}

} // namespace

Policy::Policy() :
    mode(PolicyMode::RESTRICT),
    timeout_seconds(kDefaultTimeout),
    memory_limit_mb(kDefaultMemoryMb),
    max_output_kb(kDefaultMaxOutputKb),
    blocked_imports{"os", "subprocess", "socket", "ctypes", kDynamicImportModule},
    blocked_builtins{"eval", "exec", "open", "compile", "breakpoint"},
    extra_globals(nlohmann::json::object()) {}

void Policy::Validate() const {
  if (timeout_seconds <= 0) throw ConfigError("timeout_seconds must be positive");
  if (memory_limit_mb <= 0) throw ConfigError("memory_limit_mb must be positive");
  if (max_output_kb <= 0) throw ConfigError("max_output_kb must be positive");
  if (!extra_globals.is_object()) throw ConfigError("extra_globals must be a mapping");
}

nlohmann::json Policy::ToJson() const {
  return {
    {"mode", PolicyModeName(mode)},
    {"timeout_seconds", timeout_seconds},
    {"memory_limit_mb", memory_limit_mb},
    {"max_output_kb", max_output_kb},
    {"allowed_imports", NamesToJson(allowed_imports)},
    {"blocked_imports", NamesToJson(blocked_imports)},
    {"allowed_builtins", NamesToJson(allowed_builtins)},
    {"blocked_builtins", NamesToJson(blocked_builtins)},
    {"allowed_globals", NamesToJson(allowed_globals)},
    {"blocked_globals", NamesToJson(blocked_globals)},
    {"extra_globals", extra_globals},
  };
}

Policy Policy::FromJson(const nlohmann::json& obj) {
  if (!obj.is_object()) throw ConfigError("policy must be a mapping");
  Policy ret;
  if (auto it = obj.find("mode"); it != obj.end()) {
    if (!it->is_string() || !ParsePolicyMode(it->get<std::string>(), ret.mode)) {
      throw ConfigError("mode must be 'allow' or 'restrict'");
    }
  }
  ret.timeout_seconds = LongFromJson(obj, "timeout_seconds", ret.timeout_seconds);
  ret.memory_limit_mb = LongFromJson(obj, "memory_limit_mb", ret.memory_limit_mb);
  ret.max_output_kb = LongFromJson(obj, "max_output_kb", ret.max_output_kb);
  ret.allowed_imports = NamesFromJson(obj, "allowed_imports", ret.allowed_imports);
  ret.blocked_imports = NamesFromJson(obj, "blocked_imports", ret.blocked_imports);
  ret.allowed_builtins = NamesFromJson(obj, "allowed_builtins", ret.allowed_builtins);
  ret.blocked_builtins = NamesFromJson(obj, "blocked_builtins", ret.blocked_builtins);
  ret.allowed_globals = NamesFromJson(obj, "allowed_globals", ret.allowed_globals);
  ret.blocked_globals = NamesFromJson(obj, "blocked_globals", ret.blocked_globals);
  if (auto it = obj.find("extra_globals"); it != obj.end() && !it->is_null()) {
    ret.extra_globals = *it;
  }
  ret.Validate();
  return ret;
}
