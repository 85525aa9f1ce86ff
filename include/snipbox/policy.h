#ifndef INCLUDE_SNIPBOX_POLICY_H_
#define INCLUDE_SNIPBOX_POLICY_H_

#include <set>
#include <string>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>

#define ENUM_POLICY_MODE_ \
  X(RESTRICT, "restrict") /* everything not blocked is allowed */ \
  X(ALLOW, "allow") /* everything not allowed is denied */
enum class PolicyMode {
#define X(name, str) name,
  ENUM_POLICY_MODE_
#undef X
};

// Denied in both modes, even if allow-listed (submodules included)
extern const char kDynamicImportModule[];
// Builtins denied in both modes: importlib loaders reachable without __import__
extern const std::set<std::string> kReflectionBuiltins;

class Policy {
 public:
  using Names = std::set<std::string>;

  PolicyMode mode;
  long timeout_seconds;
  long memory_limit_mb;
  long max_output_kb;
  // only the lists of the active mode are consulted
  Names allowed_imports, blocked_imports;
  Names allowed_builtins, blocked_builtins;
  Names allowed_globals, blocked_globals;
  nlohmann::json extra_globals; // object; name -> value
  // set by FromFile; RunCode reloads a policy that carries it
  std::optional<std::filesystem::path> config_path;

  Policy();

  // throws ConfigError
  void Validate() const;
  long MaxOutputBytes() const { return max_output_kb * 1024; }

  // wire form used across the worker boundary
  nlohmann::json ToJson() const;
  // throws ConfigError
  static Policy FromJson(const nlohmann::json&);
  // INI file, keys in [policy] or at top level; throws ConfigError
  static Policy FromFile(const std::filesystem::path&);
};

#endif  // INCLUDE_SNIPBOX_POLICY_H_
