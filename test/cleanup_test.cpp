#include <fstream>
#include <thread>
#include <gtest/gtest.h>
#include <docbox/job.h>
#include <docbox/paths.h>

#include "utils.h"

namespace {

fs::path MakeJobLikeDir(const std::string& name) {
  fs::path dir = kJobRoot / name;
  fs::create_directories(dir / "nested");
  std::ofstream(dir / "a.pdf") << "x";
  std::ofstream(dir / "nested" / "b.pdf") << "y";
  return dir;
}

} // namespace

TEST(Cleanup, RemovesJobDir) {
  fs::path dir = MakeJobLikeDir("cleanup_0123456789abcdef");
  fs::path outside = kJobRoot / ".outside";
  fs::create_directories(outside);
  std::ofstream(outside / "keep") << "z";
  fs::create_symlink(outside, dir / "link");

  CleanupJobDir(dir);
  EXPECT_FALSE(fs::exists(dir));
  // symlinks are removed, never followed
  EXPECT_TRUE(fs::exists(outside / "keep"));
  CleanupJobDir(dir);
  EXPECT_FALSE(fs::exists(dir));
  fs::remove_all(outside);
}

TEST(Cleanup, RefusesOtherDirs) {
  TempDir dir("cleanup");
  std::ofstream(dir.path() / "a.pdf") << "x";
  // hidden names under the root are not job directories
  CleanupJobDir(dir.path());
  EXPECT_TRUE(fs::exists(dir.path() / "a.pdf"));

  fs::path nested = dir.path() / "job_0123456789abcdef";
  fs::create_directories(nested);
  CleanupJobDir(nested);
  EXPECT_TRUE(fs::exists(nested));

  CleanupJobDir(kJobRoot);
  EXPECT_TRUE(fs::exists(dir.path()));
  CleanupJobDir(kJobRoot / "job_x" / "..");
  EXPECT_TRUE(fs::exists(kJobRoot));
}

TEST(Cleanup, Scheduled) {
  FlushCleanup();
  fs::path soon = MakeJobLikeDir("cleanup_soon");
  fs::path later = MakeJobLikeDir("cleanup_later");
  ScheduleCleanup(soon, std::chrono::seconds(0));
  ScheduleCleanup(later, std::chrono::seconds(3600));
  for (int i = 0; i < 200 && fs::exists(soon); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_FALSE(fs::exists(soon));
  EXPECT_TRUE(fs::exists(later));
  EXPECT_EQ(PendingCleanupCount(), 1u);

  FlushCleanup();
  EXPECT_EQ(PendingCleanupCount(), 0u);
  EXPECT_FALSE(fs::exists(later));
}
