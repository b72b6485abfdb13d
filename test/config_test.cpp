#include <memory>
#include <fstream>
#include <gtest/gtest.h>
#include <docbox/config.h>
#include <docbox/job.h>
#include <docbox/paths.h>

#include "utils.h"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
  fs::path job_root_;
  long deadline_ms_, retention_sec_, max_memory_mib_;
  int port_, parallel_;
  std::unique_ptr<TempDir> dir_;

  void SetUp() override {
    job_root_ = kJobRoot;
    deadline_ms_ = kJobDeadlineMs;
    retention_sec_ = kRetentionSec;
    max_memory_mib_ = kMaxMemoryMiB;
    port_ = kListenPort;
    parallel_ = kMaxParallel;
    dir_ = std::make_unique<TempDir>("config");
  }
  void TearDown() override {
    kJobRoot = job_root_;
    kJobDeadlineMs = deadline_ms_;
    kRetentionSec = retention_sec_;
    kMaxMemoryMiB = max_memory_mib_;
    kListenPort = port_;
    kMaxParallel = parallel_;
    kWorkerPath.clear();
  }

  fs::path Write(const std::string& content) {
    fs::path path = dir_->path() / "docbox.conf";
    std::ofstream(path) << content;
    return path;
  }
};

} // namespace

TEST_F(ConfigTest, Values) {
  fs::path conf = Write(R"(deadline_ms = 5000
retention_sec = 60
max_memory_mb = 128
listen_port = 9000
max_parallel = 2
modules = docx, json ,string

[extensions]
docx = pdf, .DOCX
)");
  Policy policy = Policy::Default();
  ASSERT_TRUE(ParseConfig(conf, policy));
  EXPECT_EQ(kJobDeadlineMs, 5000);
  EXPECT_EQ(kRetentionSec, 60);
  EXPECT_EQ(kMaxMemoryMiB, 128);
  EXPECT_EQ(kListenPort, 9000);
  EXPECT_EQ(kMaxParallel, 2);
  EXPECT_EQ(kJobRoot, job_root_);
  EXPECT_EQ(policy.Modules(), (std::set<std::string>{"docx", "json", "string"}));
  EXPECT_TRUE(policy.IsImportAllowed("json"));
  EXPECT_FALSE(policy.IsImportAllowed("canvas"));
  EXPECT_EQ(policy.AllowedExtensions("docx"), (std::vector<std::string>{".pdf", ".docx"}));
  EXPECT_TRUE(policy.IsOutputExtensionAllowed("pptx", "a.pptx"));
}

TEST_F(ConfigTest, Paths) {
  fs::path conf = Write("job_root = /var/tmp/docbox\nworker_path = /opt/docbox/worker\n");
  Policy policy = Policy::Default();
  ASSERT_TRUE(ParseConfig(conf, policy));
  EXPECT_EQ(kJobRoot, fs::path("/var/tmp/docbox"));
  EXPECT_EQ(WorkerPath(), fs::path("/opt/docbox/worker"));
}

TEST_F(ConfigTest, Invalid) {
  Policy policy = Policy::Default();
  EXPECT_FALSE(ParseConfig(dir_->path() / "missing.conf", policy));
  EXPECT_FALSE(ParseConfig(Write("deadline_ms = 0\n"), policy));
  EXPECT_FALSE(ParseConfig(Write("listen_port = 70000\n"), policy));
  EXPECT_FALSE(ParseConfig(Write("max_parallel = -1\n"), policy));
}
