#include <gtest/gtest.h>
#include <snipbox/errors.h>
#include <snipbox/policy.h>

#include "test_utils.h"

TEST(PolicyTest, Defaults) {
  Policy policy;
  EXPECT_EQ(policy.mode, PolicyMode::RESTRICT);
  EXPECT_EQ(policy.timeout_seconds, 5);
  EXPECT_EQ(policy.memory_limit_mb, 256);
  EXPECT_EQ(policy.max_output_kb, 128);
  EXPECT_EQ(policy.blocked_imports,
            Policy::Names({"ctypes", "importlib", "os", "socket", "subprocess"}));
  EXPECT_EQ(policy.blocked_builtins,
            Policy::Names({"breakpoint", "compile", "eval", "exec", "open"}));
  EXPECT_TRUE(policy.allowed_imports.empty());
  EXPECT_TRUE(policy.extra_globals.is_object());
  EXPECT_NO_THROW(policy.Validate());
}

TEST(PolicyTest, ValidateRejectsNonPositiveBounds) {
  Policy policy;
  policy.timeout_seconds = 0;
  EXPECT_THROW(policy.Validate(), ConfigError);
  policy = Policy();
  policy.memory_limit_mb = -1;
  EXPECT_THROW(policy.Validate(), ConfigError);
  policy = Policy();
  policy.max_output_kb = 0;
  EXPECT_THROW(policy.Validate(), ConfigError);
  policy = Policy();
  policy.extra_globals = nlohmann::json::array();
  EXPECT_THROW(policy.Validate(), ConfigError);
}

TEST(PolicyTest, JsonKeepsEveryField) {
  Policy policy;
  policy.mode = PolicyMode::ALLOW;
  policy.timeout_seconds = 9;
  policy.allowed_imports = {"json", "math"};
  policy.allowed_globals = {"x"};
  policy.extra_globals = {{"limit", 3}};
  Policy copy = Policy::FromJson(policy.ToJson());
  EXPECT_EQ(copy.mode, PolicyMode::ALLOW);
  EXPECT_EQ(copy.timeout_seconds, 9);
  EXPECT_EQ(copy.allowed_imports, policy.allowed_imports);
  EXPECT_EQ(copy.allowed_globals, policy.allowed_globals);
  EXPECT_EQ(copy.extra_globals, policy.extra_globals);
  EXPECT_EQ(copy.blocked_builtins, policy.blocked_builtins);
}

TEST(PolicyTest, FromJsonRejectsBadValues) {
  EXPECT_THROW(Policy::FromJson({{"mode", "deny"}}), ConfigError);
  EXPECT_THROW(Policy::FromJson({{"timeout_seconds", "5"}}), ConfigError);
  EXPECT_THROW(Policy::FromJson({{"blocked_imports", "os"}}), ConfigError);
  EXPECT_THROW(Policy::FromJson(nlohmann::json::array()), ConfigError);
}

TEST(PolicyFileTest, SectionAndLists) {
  TempFile file(R"([policy]
mode = allow
timeout_seconds = 3
allowed_imports = json, math
allowed_builtins = ["print", "len"]
allowed_globals = x
extra_globals = {"limit": 7}
)");
  Policy policy = Policy::FromFile(file.path());
  EXPECT_EQ(policy.mode, PolicyMode::ALLOW);
  EXPECT_EQ(policy.timeout_seconds, 3);
  EXPECT_EQ(policy.memory_limit_mb, 256);
  EXPECT_EQ(policy.allowed_imports, Policy::Names({"json", "math"}));
  EXPECT_EQ(policy.allowed_builtins, Policy::Names({"len", "print"}));
  EXPECT_EQ(policy.allowed_globals, Policy::Names({"x"}));
  EXPECT_EQ(policy.extra_globals["limit"], 7);
  ASSERT_TRUE(policy.config_path);
  EXPECT_EQ(*policy.config_path, file.path());
}

TEST(PolicyFileTest, TopLevelKeysAndMissingLists) {
  TempFile file("mode = restrict\nblocked_imports = os,  socket\n");
  Policy policy = Policy::FromFile(file.path());
  EXPECT_EQ(policy.mode, PolicyMode::RESTRICT);
  EXPECT_EQ(policy.blocked_imports, Policy::Names({"os", "socket"}));
  // absent from the file, so empty rather than the defaults
  EXPECT_TRUE(policy.blocked_builtins.empty());
}

TEST(PolicyFileTest, Errors) {
  EXPECT_THROW(Policy::FromFile("/nonexistent/snipbox/policy.ini"), ConfigError);
  TempFile bad_mode("[policy]\nmode = sometimes\n");
  EXPECT_THROW(Policy::FromFile(bad_mode.path()), ConfigError);
  TempFile bad_number("[policy]\ntimeout_seconds = soon\n");
  EXPECT_THROW(Policy::FromFile(bad_number.path()), ConfigError);
  TempFile bad_globals("[policy]\nextra_globals = [1, 2]\n");
  EXPECT_THROW(Policy::FromFile(bad_globals.path()), ConfigError);
  TempFile zero_memory("[policy]\nmemory_limit_mb = 0\n");
  EXPECT_THROW(Policy::FromFile(zero_memory.path()), ConfigError);
}
