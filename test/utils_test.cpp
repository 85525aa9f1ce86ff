#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include "utils.h"

TEST(UtilsTest, TruncateUtf8) {
  EXPECT_EQ(TruncateUtf8("hello", 10), "hello");
  EXPECT_EQ(TruncateUtf8("hello", 3), "hel");
  // "é" is two bytes
  EXPECT_EQ(TruncateUtf8("a\xc3\xa9", 2), "a");
  EXPECT_EQ(TruncateUtf8("a\xc3\xa9", 3), "a\xc3\xa9");
  // four-byte sequence cut in the middle
  EXPECT_EQ(TruncateUtf8("\xf0\x9f\x98\x80z", 3), "");
  EXPECT_EQ(TruncateUtf8("\xf0\x9f\x98\x80z", 4), "\xf0\x9f\x98\x80");
}

TEST(UtilsTest, TrimAndSplit) {
  EXPECT_EQ(Trim("  a b \n"), "a b");
  EXPECT_EQ(Trim(" \t "), "");
  EXPECT_EQ(Split("a,b,,c", ','), std::vector<std::string>({"a", "b", "", "c"}));
  EXPECT_EQ(Split("", ','), std::vector<std::string>({""}));
}

TEST(UtilsTest, Hashes) {
  EXPECT_EQ(Sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  std::string hex = RandomHex(12);
  EXPECT_EQ(hex.size(), 12);
  EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(UtilsTest, EnumNames) {
  PolicyMode mode = PolicyMode::RESTRICT;
  EXPECT_TRUE(ParsePolicyMode("allow", mode));
  EXPECT_EQ(mode, PolicyMode::ALLOW);
  EXPECT_FALSE(ParsePolicyMode("ALLOW!", mode));
  EXPECT_STREQ(ErrorKindName(ErrorKind::POLICY_VIOLATION), "policy_violation");
  EnvCreator creator = EnvCreator::UV;
  EXPECT_TRUE(ParseEnvCreator("python", creator));
  EXPECT_EQ(creator, EnvCreator::PYTHON);
  EXPECT_STREQ(ContainerStateName(ContainerState::IN_USE), "in_use");
}

TEST(UtilsTest, FileLockAndDirs) {
  fs::path dir = MakeTempDir(fs::temp_directory_path(), "snipbox_utils_");
  ASSERT_FALSE(dir.empty());
  {
    ScopedFileLock lock(dir / "env.lock");
    EXPECT_TRUE(lock.Locked());
  }
  {
    // threads of one process exclude each other
    std::atomic_int holders = 0, max_holders = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
      threads.emplace_back([&]() {
        ScopedFileLock lock(dir / "env.lock");
        int now = ++holders;
        int prev = max_holders;
        while (now > prev && !max_holders.compare_exchange_weak(prev, now));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        holders--;
      });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(max_holders.load(), 1);
  }
  EXPECT_TRUE(WriteFile(dir / "a" , "content"));
  EXPECT_TRUE(RemoveAll(dir));
  EXPECT_FALSE(fs::exists(dir));
}
