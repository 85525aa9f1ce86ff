#ifndef SNIPBOX_CAPABILITY_H_
#define SNIPBOX_CAPABILITY_H_

#include <set>
#include <string>
#include <vector>
#include <utility>

#include <nlohmann/json.hpp>
#include <snipbox/policy.h>

bool IsIdentifier(const std::string&);
// names an input key can never be bound as
bool IsReservedGlobal(const std::string&);

struct GlobalBindings {
  // in binding order: extra globals, input_data, then input keys
  std::vector<std::pair<std::string, nlohmann::json>> admitted;
  // candidates the globals filter refused
  std::set<std::string> denied;
};

// Decides which imports, builtins and top-level names a snippet may use.
class CapabilityTable {
  PolicyMode mode_;
  Policy::Names allowed_imports_, blocked_imports_;
  Policy::Names allowed_builtins_, blocked_builtins_;
  Policy::Names allowed_globals_, blocked_globals_;

  static bool Admit(PolicyMode, const Policy::Names& allowed, const Policy::Names& blocked,
                    const std::string& name);
 public:
  explicit CapabilityTable(const Policy&);

  PolicyMode Mode() const { return mode_; }
  // reason is the error message on denial
  bool AdmitImport(const std::string& name, std::string& reason) const;
  bool AdmitBuiltin(const std::string& name) const;
  bool AdmitGlobal(const std::string& name) const;
  GlobalBindings BindGlobals(const nlohmann::json& input_data,
                             const nlohmann::json& extra_globals) const;
};

#endif  // SNIPBOX_CAPABILITY_H_
