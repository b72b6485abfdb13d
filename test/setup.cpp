#include <unistd.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <docbox/job.h>
#include <docbox/paths.h>
#include <docbox/logger.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    InitLogger();
    kJobRoot = fs::temp_directory_path() / ("docbox_test_" + std::to_string(getpid()));
    fs::create_directories(kJobRoot);
    kJobDeadlineMs = 10000;
    kTerminateGraceMs = 500;
  }
  void TearDown() override {
    fs::remove_all(kJobRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc) internal::kDataDir = fs::absolute(fs::path(argv[0])).parent_path();
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
