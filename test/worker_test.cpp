#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <gtest/gtest.h>

#include "docbox/worker.h"
#include "docbox/protocol.h"
#include "utils.h"

namespace {

// Runs a worker in-process and returns what it wrote on the channel
std::optional<ExecutionResult> RunWorker(const std::string& source, const fs::path& dir,
                                         const Policy& policy = Policy::Default()) {
  fs::path source_file = dir / "script.lua";
  {
    std::ofstream fout(source_file);
    fout << source;
  }
  WorkerOptions opts;
  opts.job_dir = dir;
  opts.source_file = source_file;
  opts.memory_limit = 64 << 20;

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return std::nullopt;
  ResultChannel channel(fds[1]);
  Worker worker(policy, std::move(opts));
  worker.Run(channel);
  EXPECT_EQ(worker.state(), WorkerState::TERMINAL);
  EXPECT_TRUE(channel.reported());
  close(fds[1]);
  std::string data;
  char buf[4096];
  for (ssize_t n; (n = read(fds[0], buf, sizeof(buf))) > 0;) data.append(buf, n);
  close(fds[0]);
  // the source file was written here only for the test
  fs::remove(source_file);
  return DecodeResult(data);
}

} // namespace

TEST(Worker, Success) {
  TempDir dir("worker");
  auto result = RunWorker(R"(
local c = require('canvas').Canvas('b.pdf')
c:drawString(10, 10, 'x')
c:save()
require('docx').Document():add_paragraph('y'):save('a.docx')
)", dir.path());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->status, Outcome::SUCCESS);
  fs::path abs = fs::absolute(dir.path()).lexically_normal();
  EXPECT_EQ(result->files, (std::vector<std::string>{abs / "a.docx", abs / "b.pdf"}));
  EXPECT_EQ(result->message, "");
}

TEST(Worker, FailureDiscardsFiles) {
  TempDir dir("worker");
  auto result = RunWorker(R"(
require('docx').Document():save('a.docx')
error('late failure')
)", dir.path());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->status, Outcome::ERROR);
  EXPECT_TRUE(result->files.empty());
  EXPECT_EQ(result->message.rfind("RuntimeError: ", 0), 0u) << result->message;
  EXPECT_NE(result->message.find("late failure"), std::string::npos);
}

TEST(Worker, ImportViolation) {
  TempDir dir("worker");
  auto result = RunWorker("pcall(require, 'socket')", dir.path());
  ASSERT_TRUE(result);
  EXPECT_EQ(result->status, Outcome::ERROR);
  EXPECT_EQ(result->message.rfind("ImportError: ", 0), 0u) << result->message;
}

TEST(Worker, MissingJobDir) {
  TempDir dir("worker");
  WorkerOptions opts;
  opts.job_dir = dir.path() / "missing";
  opts.source_file = dir.path() / "missing.lua";
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
  ResultChannel channel(fds[1]);
  Policy policy = Policy::Default();
  Worker worker(policy, std::move(opts));
  ExecutionResult result = worker.Run(channel);
  close(fds[1]);
  close(fds[0]);
  EXPECT_EQ(result.status, Outcome::ERROR);
  EXPECT_EQ(result.message.rfind("SetupError: ", 0), 0u) << result.message;
  EXPECT_EQ(worker.state(), WorkerState::TERMINAL);
}

TEST(Worker, CollectOutputs) {
  TempDir dir("worker");
  auto touch = [&](const std::string& name) { std::ofstream(dir.path() / name) << "x"; };
  touch("b.pdf");
  touch("a.PPTX");
  touch("run.sh");
  touch("noext");
  fs::create_directory(dir.path() / "sub.pdf");
  fs::create_symlink(dir.path() / "b.pdf", dir.path() / "link.pdf");
  fs::path abs = fs::absolute(dir.path()).lexically_normal();
  EXPECT_EQ(CollectOutputs(Policy::Default(), dir.path()),
            (std::vector<std::string>{abs / "a.PPTX", abs / "b.pdf"}));
  EXPECT_TRUE(CollectOutputs(Policy::Default(), dir.path() / "missing").empty());
}

TEST(Worker, StateNames) {
  EXPECT_STREQ(WorkerStateName(WorkerState::STARTING), "starting");
  EXPECT_STREQ(WorkerStateName(WorkerState::COLLECTING), "collecting");
  EXPECT_STREQ(WorkerStateName(WorkerState::TERMINAL), "terminal");
}
