#include "capability.h"

#include <spdlog/fmt/fmt.h>

namespace {

// interpreter plumbing admitted in allow mode without being listed
const std::set<std::string> kPlumbingBuiltins = {
  "__build_class__", "__name__", "__debug__", "__doc__", "__package__",
};

} // namespace

bool IsIdentifier(const std::string& name) {
  if (name.empty()) return false;
  for (size_t i = 0; i < name.size(); i++) {
    unsigned char c = name[i];
    // non-ASCII identifiers are rejected
    if (c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) continue;
    if (i && c >= '0' && c <= '9') continue;
    return false;
  }
  return true;
}

bool IsReservedGlobal(const std::string& name) {
  return name == "__builtins__" || name == "input_data" || name == "result";
}

CapabilityTable::CapabilityTable(const Policy& policy) :
    mode_(policy.mode),
    allowed_imports_(policy.allowed_imports), blocked_imports_(policy.blocked_imports),
    allowed_builtins_(policy.allowed_builtins), blocked_builtins_(policy.blocked_builtins),
    allowed_globals_(policy.allowed_globals), blocked_globals_(policy.blocked_globals) {}

bool CapabilityTable::Admit(PolicyMode mode, const Policy::Names& allowed,
                            const Policy::Names& blocked, const std::string& name) {
  switch (mode) {
    case PolicyMode::RESTRICT: return !blocked.count(name);
    case PolicyMode::ALLOW: return allowed.count(name);
  }
  __builtin_unreachable();
}

bool CapabilityTable::AdmitImport(const std::string& name, std::string& reason) const {
  std::string root = name.substr(0, name.find('.'));
  bool admitted = root != kDynamicImportModule &&
      Admit(mode_, allowed_imports_, blocked_imports_, root);
  if (admitted) return true;
  if (mode_ == PolicyMode::ALLOW) {
    reason = fmt::format("Import '{}' is not allowed by policy", name);
  } else {
    reason = fmt::format("Import '{}' is blocked by policy", name);
  }
  return false;
}

bool CapabilityTable::AdmitBuiltin(const std::string& name) const {
  if (kReflectionBuiltins.count(name)) return false;
  if (mode_ == PolicyMode::ALLOW && kPlumbingBuiltins.count(name)) return true;
  return Admit(mode_, allowed_builtins_, blocked_builtins_, name);
}

bool CapabilityTable::AdmitGlobal(const std::string& name) const {
  return Admit(mode_, allowed_globals_, blocked_globals_, name);
}

GlobalBindings CapabilityTable::BindGlobals(const nlohmann::json& input_data,
                                            const nlohmann::json& extra_globals) const {
  GlobalBindings ret;
  std::set<std::string> bound;
  auto Bind = [&](const std::string& name, const nlohmann::json& value) {
    if (bound.count(name)) return;
    if (!AdmitGlobal(name)) {
      ret.denied.insert(name);
      return;
    }
    bound.insert(name);
    ret.admitted.emplace_back(name, value);
  };
  if (extra_globals.is_object()) {
    for (auto& [key, value] : extra_globals.items()) {
      if (IsIdentifier(key) && key != "__builtins__" && key != "result") Bind(key, value);
    }
  }
  Bind("input_data", input_data.is_null() ? nlohmann::json::object() : input_data);
  if (input_data.is_object()) {
    for (auto& [key, value] : input_data.items()) {
      if (!IsIdentifier(key) || key[0] == '_' || IsReservedGlobal(key)) continue;
      Bind(key, value);
    }
  }
  return ret;
}
