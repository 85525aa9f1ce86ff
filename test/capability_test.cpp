#include <gtest/gtest.h>

#include "capability.h"

namespace {

Policy AllowPolicy() {
  Policy policy;
  policy.mode = PolicyMode::ALLOW;
  policy.allowed_imports = {"json", "importlib"};
  policy.allowed_builtins = {"print"};
  policy.allowed_globals = {"x"};
  return policy;
}

} // namespace

TEST(CapabilityTest, RestrictImports) {
  CapabilityTable table((Policy()));
  std::string reason;
  EXPECT_TRUE(table.AdmitImport("json", reason));
  EXPECT_TRUE(table.AdmitImport("collections.abc", reason));
  EXPECT_FALSE(table.AdmitImport("os.path", reason));
  EXPECT_EQ(reason, "Import 'os.path' is blocked by policy");
  EXPECT_FALSE(table.AdmitImport("subprocess", reason));
}

TEST(CapabilityTest, AllowImports) {
  CapabilityTable table(AllowPolicy());
  std::string reason;
  EXPECT_TRUE(table.AdmitImport("json", reason));
  EXPECT_TRUE(table.AdmitImport("json.decoder", reason));
  EXPECT_FALSE(table.AdmitImport("math", reason));
  EXPECT_EQ(reason, "Import 'math' is not allowed by policy");
}

TEST(CapabilityTest, DynamicImportModuleAlwaysDenied) {
  Policy restrict;
  restrict.blocked_imports.clear();
  std::string reason;
  EXPECT_FALSE(CapabilityTable(restrict).AdmitImport("importlib", reason));
  EXPECT_FALSE(CapabilityTable(restrict).AdmitImport("importlib.util", reason));
  // allow-listed, still denied
  EXPECT_FALSE(CapabilityTable(AllowPolicy()).AdmitImport("importlib", reason));
  EXPECT_FALSE(CapabilityTable(AllowPolicy()).AdmitImport("importlib.machinery", reason));
}

TEST(CapabilityTest, Builtins) {
  CapabilityTable restrict((Policy()));
  EXPECT_TRUE(restrict.AdmitBuiltin("print"));
  EXPECT_FALSE(restrict.AdmitBuiltin("eval"));
  CapabilityTable allow(AllowPolicy());
  EXPECT_TRUE(allow.AdmitBuiltin("print"));
  EXPECT_FALSE(allow.AdmitBuiltin("len"));
}

TEST(CapabilityTest, LoaderBuiltinsAlwaysDenied) {
  Policy restrict;
  restrict.blocked_builtins.clear();
  Policy allow = AllowPolicy();
  allow.allowed_builtins = {"print", "__loader__", "__spec__"};
  for (auto& policy : {restrict, allow}) {
    CapabilityTable table(policy);
    EXPECT_FALSE(table.AdmitBuiltin("__loader__"));
    EXPECT_FALSE(table.AdmitBuiltin("__spec__"));
  }
  CapabilityTable table(AllowPolicy());
  EXPECT_TRUE(table.AdmitBuiltin("__build_class__"));
  EXPECT_TRUE(table.AdmitBuiltin("__name__"));
  EXPECT_FALSE(table.AdmitBuiltin("__import__"));
}

TEST(CapabilityTest, Identifiers) {
  EXPECT_TRUE(IsIdentifier("x"));
  EXPECT_TRUE(IsIdentifier("_private1"));
  EXPECT_FALSE(IsIdentifier(""));
  EXPECT_FALSE(IsIdentifier("1x"));
  EXPECT_FALSE(IsIdentifier("a-b"));
  EXPECT_FALSE(IsIdentifier("a b"));
}

TEST(CapabilityTest, BindGlobalsSkipsUnbindableKeys) {
  CapabilityTable table((Policy()));
  nlohmann::json input = {
    {"x", 1}, {"_hidden", 2}, {"not valid", 3}, {"result", 4}, {"input_data", 5},
    {"__builtins__", 6},
  };
  GlobalBindings bindings = table.BindGlobals(input, nlohmann::json::object());
  std::vector<std::string> names;
  for (auto& [name, value] : bindings.admitted) names.push_back(name);
  EXPECT_EQ(names, std::vector<std::string>({"input_data", "x"}));
  EXPECT_EQ(bindings.admitted[0].second, input);
}

TEST(CapabilityTest, ExtraGlobalsWinOverInput) {
  CapabilityTable table((Policy()));
  GlobalBindings bindings = table.BindGlobals({{"limit", 1}}, {{"limit", 99}});
  ASSERT_FALSE(bindings.admitted.empty());
  EXPECT_EQ(bindings.admitted[0].first, "limit");
  EXPECT_EQ(bindings.admitted[0].second, 99);
  int count = 0;
  for (auto& [name, value] : bindings.admitted) count += name == "limit";
  EXPECT_EQ(count, 1);
}

TEST(CapabilityTest, GlobalsFilter) {
  Policy policy;
  policy.blocked_globals = {"secret", "input_data"};
  GlobalBindings bindings = CapabilityTable(policy).BindGlobals(
      {{"secret", 1}, {"x", 2}}, nlohmann::json::object());
  ASSERT_EQ(bindings.admitted.size(), 1);
  EXPECT_EQ(bindings.admitted[0].first, "x");
  EXPECT_EQ(bindings.denied, std::set<std::string>({"input_data", "secret"}));

  GlobalBindings allow = CapabilityTable(AllowPolicy()).BindGlobals(
      {{"x", 1}, {"y", 2}}, nlohmann::json::object());
  ASSERT_EQ(allow.admitted.size(), 1);
  EXPECT_EQ(allow.admitted[0].first, "x");
  EXPECT_TRUE(allow.denied.count("y"));
}
