#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <snipbox/logger.h>
#include <snipbox/paths.h>

spdlog::level::level_enum log_level;

class SnipboxEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    InitLogger();
  }
  void TearDown() override {
    fs::remove_all(kRunRoot);
  }
};

testing::Environment* const snipbox_env = testing::AddGlobalTestEnvironment(new SnipboxEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc) internal::kDataDir = fs::absolute(fs::path(argv[0])).parent_path();
  kRunRoot = fs::temp_directory_path() / "snipbox_test_runs";
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
