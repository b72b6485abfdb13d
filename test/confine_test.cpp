#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <csignal>
#include <fstream>
#include <gtest/gtest.h>

#include "docbox/confine.h"
#include "docbox/script_error.h"
#include "utils.h"

namespace {

std::string Render(const std::string& ext) { return "data" + ext; }

} // namespace

TEST(SafeBaseName, StripsDirectories) {
  EXPECT_EQ(SafeBaseName("report.pdf"), "report.pdf");
  EXPECT_EQ(SafeBaseName("../../etc/evil.pdf"), "evil.pdf");
  EXPECT_EQ(SafeBaseName("/abs/path/x.docx"), "x.docx");
  EXPECT_EQ(SafeBaseName("..\\..\\win.pdf"), "win.pdf");
  EXPECT_EQ(SafeBaseName("a/b\\c.pptx"), "c.pptx");
  EXPECT_FALSE(SafeBaseName("").has_value());
  EXPECT_FALSE(SafeBaseName("dir/").has_value());
  EXPECT_FALSE(SafeBaseName("a/..").has_value());
  EXPECT_FALSE(SafeBaseName(".").has_value());
  EXPECT_FALSE(SafeBaseName(std::string("a\0.pdf", 6)).has_value());
}

TEST(OutputConfiner, ConfinesIntoJobDir) {
  TempDir dir("confine");
  Policy policy = Policy::Default();
  OutputConfiner confiner(policy, "canvas", dir.path());
  EXPECT_EQ(confiner.Confine("../../etc/evil.pdf"), dir.path() / "evil.pdf");
  auto path = confiner.Save("/tmp/../x/Out.PDF", Render);
  EXPECT_EQ(path, dir.path() / "Out.PDF");
  EXPECT_EQ(ReadAll(path), "data.pdf");
}

TEST(OutputConfiner, RejectsExtension) {
  TempDir dir("confine");
  Policy policy = Policy::Default();
  OutputConfiner confiner(policy, "canvas", dir.path());
  try {
    confiner.Save("chart.exe", Render);
    FAIL() << "no exception";
  } catch (ScriptError& e) {
    EXPECT_EQ(e.kind(), DiagnosticKind::POLICY);
    EXPECT_NE(std::string(e.what()).find(".pdf"), std::string::npos);
  }
  EXPECT_THROW(confiner.Confine(".."), ScriptError);
  EXPECT_THROW(confiner.Confine("noext"), ScriptError);
  EXPECT_TRUE(fs::is_empty(dir.path()));
}

TEST(OutputConfiner, NeverFollowsSymlink) {
  TempDir dir("confine");
  TempDir outside("outside");
  fs::path victim = outside.path() / "victim.pdf";
  { std::ofstream(victim) << "original"; }
  fs::create_symlink(victim, dir.path() / "link.pdf");

  Policy policy = Policy::Default();
  OutputConfiner confiner(policy, "docx", dir.path());
  EXPECT_THROW(confiner.Save("link.pdf", Render), ScriptError);
  EXPECT_EQ(ReadAll(victim), "original");
  EXPECT_FALSE(fs::is_symlink(dir.path() / "link.pdf"));
}

TEST(OutputConfiner, OverwritesRegularFile) {
  TempDir dir("confine");
  Policy policy = Policy::Default();
  OutputConfiner confiner(policy, "docx", dir.path());
  confiner.Save("a.docx", [](const std::string&) { return std::string("a much longer first version"); });
  confiner.Save("a.docx", Render);
  EXPECT_EQ(ReadAll(dir.path() / "a.docx"), "data.docx");
}

TEST(OutputConfiner, PartialWriteRemoved) {
  TempDir dir("confine");
  Policy policy = Policy::Default();
  OutputConfiner confiner(policy, "canvas", dir.path());
  // the file size limit is applied in a child only
  pid_t pid = fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    signal(SIGXFSZ, SIG_IGN);
    struct rlimit lim;
    getrlimit(RLIMIT_FSIZE, &lim);
    lim.rlim_cur = 4096;
    if (setrlimit(RLIMIT_FSIZE, &lim) < 0) _exit(3);
    bool thrown = false;
    try {
      confiner.Save("big.pdf", [](const std::string&) { return std::string(1 << 20, 'x'); });
    } catch (ScriptError&) {
      thrown = true;
    }
    if (!thrown) _exit(1);
    _exit(fs::exists(dir.path() / "big.pdf") ? 2 : 0);
  }
  int status;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}
