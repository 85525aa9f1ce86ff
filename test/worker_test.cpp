#include <gtest/gtest.h>

#include "test_utils.h"

namespace {

Policy AllowPolicy(std::initializer_list<std::string> imports) {
  Policy policy;
  policy.mode = PolicyMode::ALLOW;
  policy.allowed_imports = imports;
  policy.allowed_builtins = {"print", "len", "range", "sum", "int", "str"};
  return policy;
}

bool Contains(const std::optional<std::string>& str, const std::string& needle) {
  return str && str->find(needle) != std::string::npos;
}

} // namespace

TEST(WorkerTest, InputDataAndResult) {
  ExecutionResult res = RunWorkerDirect("result = input_data['x'] + y", Policy(),
                                        {{"x", 3}, {"y", 4}});
  ASSERT_TRUE(res.ok) << res.error.value_or("") << res.stderr_text;
  EXPECT_EQ(res.result, 7);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.error_kind, ErrorKind::NONE);
}

TEST(WorkerTest, StdoutCaptured) {
  ExecutionResult res = RunWorkerDirect("print('hello')\nresult = 123");
  ASSERT_TRUE(res.ok) << res.stderr_text;
  EXPECT_EQ(res.stdout_text, "hello\n");
  EXPECT_EQ(res.result, 123);
}

TEST(WorkerTest, NoResultIsNull) {
  ExecutionResult res = RunWorkerDirect("x = 1");
  EXPECT_TRUE(res.ok);
  EXPECT_FALSE(res.result);
}

TEST(WorkerTest, ResultConversion) {
  ExecutionResult res = RunWorkerDirect(
      "result = {'t': (1, 2), 's': {3}, 'n': None, 'f': 1.5, 'b': True, 'o': object}");
  ASSERT_TRUE(res.ok) << res.stderr_text;
  ASSERT_TRUE(res.result);
  EXPECT_EQ((*res.result)["t"], nlohmann::json({1, 2}));
  EXPECT_EQ((*res.result)["s"], "{3}");
  EXPECT_TRUE((*res.result)["n"].is_null());
  EXPECT_EQ((*res.result)["f"], 1.5);
  EXPECT_EQ((*res.result)["b"], true);
  EXPECT_TRUE((*res.result)["o"].is_string());
}

TEST(WorkerTest, OutputTruncated) {
  Policy policy;
  policy.max_output_kb = 4;
  ExecutionResult res = RunWorkerDirect("print('x' * 100000)", policy);
  EXPECT_TRUE(res.ok);
  EXPECT_EQ(res.stdout_text.size(), 4096);
}

TEST(WorkerTest, RuntimeError) {
  ExecutionResult res = RunWorkerDirect("result = 1\n1 / 0");
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.error_kind, ErrorKind::RUNTIME_ERROR);
  EXPECT_TRUE(Contains(res.error, "ZeroDivisionError"));
  EXPECT_NE(res.stderr_text.find("Traceback"), std::string::npos);
  EXPECT_EQ(res.result, 1);
  EXPECT_EQ(res.exit_code, 1);
}

TEST(WorkerTest, SyntaxError) {
  ExecutionResult res = RunWorkerDirect("def broken(:\n  pass");
  EXPECT_FALSE(res.ok);
  EXPECT_TRUE(Contains(res.error, "SyntaxError"));
}

TEST(WorkerTest, SystemExit) {
  ExecutionResult res = RunWorkerDirect("import sys\nresult = 5\nsys.exit(0)");
  EXPECT_TRUE(res.ok) << res.error.value_or("");
  EXPECT_EQ(res.result, 5);

  res = RunWorkerDirect("exit(0)");
  EXPECT_TRUE(res.ok) << res.error.value_or("");
  EXPECT_EQ(res.exit_code, 0);

  res = RunWorkerDirect("exit(2)");
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.exit_code, 2);
  EXPECT_EQ(res.error_kind, ErrorKind::EXIT_NONZERO);
  EXPECT_EQ(res.error, "SystemExit: 2");

  // a status of 256 would wrap to 0 as a process exit code
  res = RunWorkerDirect("exit(256)");
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.exit_code, 256);
  EXPECT_EQ(res.error_kind, ErrorKind::EXIT_NONZERO);
  EXPECT_EQ(res.error, "SystemExit: 256");

  res = RunWorkerDirect("raise SystemExit('bye')");
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_NE(res.stderr_text.find("bye"), std::string::npos);
}

TEST(WorkerTest, RestrictBlocksImports) {
  for (const char* code : {"import os", "import os.path", "from subprocess import run",
                           "__import__('socket')", "import importlib"}) {
    ExecutionResult res = RunWorkerDirect(code);
    EXPECT_FALSE(res.ok) << code;
    EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION) << code;
    EXPECT_TRUE(Contains(res.error, "blocked by policy")) << code;
  }
  EXPECT_TRUE(RunWorkerDirect("import json\nresult = json.dumps([1])").ok);
}

TEST(WorkerTest, RestrictBlocksBuiltins) {
  ExecutionResult res = RunWorkerDirect("result = eval('1 + 1')");
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
  EXPECT_TRUE(Contains(res.error, "builtin 'eval' is blocked by policy"));

  res = RunWorkerDirect("open('/etc/passwd')");
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
}

TEST(WorkerTest, AllowMode) {
  Policy policy = AllowPolicy({"json", "importlib"});
  ExecutionResult res = RunWorkerDirect("import json\nresult = len(json.dumps({'a': 1}))", policy);
  ASSERT_TRUE(res.ok) << res.error.value_or("");
  EXPECT_EQ(res.result, 8);

  res = RunWorkerDirect("import math", policy);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
  EXPECT_TRUE(Contains(res.error, "not allowed by policy"));

  // dynamic import stays closed even when listed
  res = RunWorkerDirect("import importlib", policy);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);

  res = RunWorkerDirect("result = abs(-1)", policy);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
  EXPECT_TRUE(Contains(res.error, "builtin 'abs'"));
}

TEST(WorkerTest, ModuleLoaderUnreachable) {
  const char* code = "result = __loader__.load_module('posix').getpid()";
  ExecutionResult res = RunWorkerDirect(code);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
  EXPECT_TRUE(Contains(res.error, "builtin '__loader__' is blocked by policy"));

  Policy policy = AllowPolicy({});
  policy.allowed_builtins = {"len", "__loader__", "__spec__"};
  res = RunWorkerDirect(code, policy);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);

  res = RunWorkerDirect("result = __spec__.loader", policy);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);

  // class statements still work in allow mode
  res = RunWorkerDirect("class A:\n  n = 2\nresult = len([A.n])", policy);
  ASSERT_TRUE(res.ok) << res.error.value_or("");
  EXPECT_EQ(res.result, 1);
}

TEST(WorkerTest, BlockedGlobal) {
  Policy policy;
  policy.blocked_globals = {"secret"};
  ExecutionResult res = RunWorkerDirect("result = secret", policy, {{"secret", 1}});
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.error_kind, ErrorKind::POLICY_VIOLATION);
  EXPECT_TRUE(Contains(res.error, "global 'secret' is blocked by policy"));
}

TEST(WorkerTest, ExtraGlobals) {
  Policy policy;
  policy.extra_globals = {{"limit", 10}, {"names", {"a", "b"}}};
  ExecutionResult res = RunWorkerDirect("result = limit + len(names)", policy, {{"limit", 1}});
  ASSERT_TRUE(res.ok) << res.error.value_or("");
  EXPECT_EQ(res.result, 12);
}

TEST(WorkerTest, MemoryLimit) {
  Policy policy;
  policy.memory_limit_mb = 256;
  ExecutionResult res = RunWorkerDirect("x = bytearray(512 * 1024 * 1024)", policy);
  EXPECT_FALSE(res.ok);
  EXPECT_TRUE(res.resource_exceeded);
  EXPECT_EQ(res.error_kind, ErrorKind::RESOURCE_EXCEEDED);

  res = RunWorkerDirect("x = bytearray(16 * 1024 * 1024)\nresult = len(x)", policy);
  EXPECT_TRUE(res.ok) << res.error.value_or("");
}

TEST(WorkerTest, Timeout) {
  Policy policy;
  policy.timeout_seconds = 1;
  ExecutionResult res = RunWorkerDirect("while True: pass", policy);
  EXPECT_FALSE(res.ok);
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.error_kind, ErrorKind::TIMEOUT);
}
