#include <gtest/gtest.h>
#include <snipbox/errors.h>

#include "packages.h"

TEST(PackageTest, NormalizeSortsAndDedups) {
  auto pins = NormalizePinnedPackages({"requests==2.31.0", " numpy==1.26.4", "requests==2.31.0"});
  EXPECT_EQ(pins, std::vector<std::string>({"numpy==1.26.4", "requests==2.31.0"}));
  EXPECT_TRUE(NormalizePinnedPackages({}).empty());
}

TEST(PackageTest, RejectsUnpinned) {
  EXPECT_THROW(NormalizePinnedPackages({"requests"}), ConfigError);
  EXPECT_THROW(NormalizePinnedPackages({"requests>=2"}), ConfigError);
  EXPECT_THROW(NormalizePinnedPackages({"numpy==1.26.4", "a b==1"}), ConfigError);
  try {
    NormalizePinnedPackages({"ok==1", "bad", "worse>1"});
    FAIL();
  } catch (const ConfigError& err) {
    std::string msg = err.what();
    EXPECT_NE(msg.find("bad"), std::string::npos);
    EXPECT_NE(msg.find("worse>1"), std::string::npos);
    EXPECT_EQ(msg.find("ok==1"), std::string::npos);
  }
}

TEST(PackageTest, EnvironmentHash) {
  std::string base = EnvironmentHash("3.11", "", {"numpy==1.26.4"});
  EXPECT_EQ(base.size(), 16);
  EXPECT_EQ(base, EnvironmentHash("3.11", "", {"numpy==1.26.4"}));
  EXPECT_NE(base, EnvironmentHash("3.12", "", {"numpy==1.26.4"}));
  EXPECT_NE(base, EnvironmentHash("3.11", "team-a", {"numpy==1.26.4"}));
  EXPECT_NE(base, EnvironmentHash("3.11", "", {"numpy==1.26.3"}));
  EXPECT_NE(base, EnvironmentHash("3.11", "", {}));
}
