#include <unistd.h>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "docbox/protocol.h"

namespace {

std::string ReadPipe(int fd) {
  std::string ret;
  char buf[4096];
  ssize_t n;
  while ((n = read(fd, buf, sizeof(buf))) > 0) ret.append(buf, n);
  return ret;
}

} // namespace

TEST(Protocol, Diagnostic) {
  EXPECT_EQ(MakeDiagnostic(DiagnosticKind::IMPORT, "import of 'socket' is not allowed"),
            "ImportError: import of 'socket' is not allowed");
  std::string trace = "script:1: in a\n\nscript:2: in b\nscript:3\nscript:4\nscript:5\nscript:6\n";
  std::string diag = MakeDiagnostic(DiagnosticKind::RUNTIME, "boom", trace);
  EXPECT_EQ(diag, "RuntimeError: boom\nscript:1: in a\nscript:2: in b\nscript:3\nscript:4\nscript:5");
}

TEST(Protocol, DiagnosticBounded) {
  std::string diag = MakeDiagnostic(DiagnosticKind::RUNTIME, std::string(10000, 'x'));
  EXPECT_EQ(diag.size(), kMaxDiagnosticLength);
  EXPECT_EQ(diag.substr(diag.size() - 3), "...");
  // never cuts a multibyte sequence
  std::string cut = BoundedExcerpt("\xE4\xB8\xAD\xE6\x96\x87\xE5\xAD\x97", 8);
  EXPECT_EQ(cut, "\xE4\xB8\xAD...");
}

TEST(Protocol, Encode) {
  auto success = nlohmann::json::parse(EncodeResult(ExecutionResult::Success({"/j/a.pdf", "/j/b.docx"})));
  EXPECT_EQ(success, (nlohmann::json{{"status", "success"}, {"files", {"/j/a.pdf", "/j/b.docx"}}}));
  auto error = nlohmann::json::parse(EncodeResult(ExecutionResult::Error("RuntimeError: x")));
  EXPECT_EQ(error, (nlohmann::json{{"status", "error"}, {"message", "RuntimeError: x"}}));
  auto empty = nlohmann::json::parse(EncodeResult(ExecutionResult::Success({})));
  EXPECT_TRUE(empty["files"].is_array());
  EXPECT_TRUE(empty["files"].empty());
}

TEST(Protocol, EncodeInvalidUtf8) {
  std::string data = EncodeResult(ExecutionResult::Error("bad \xFF byte"));
  EXPECT_FALSE(nlohmann::json::parse(data, nullptr, false).is_discarded());
}

TEST(Protocol, Decode) {
  auto res = DecodeResult(R"({"status": "success", "files": ["/a/b.pdf"]})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, Outcome::SUCCESS);
  EXPECT_EQ(res->files, std::vector<std::string>{"/a/b.pdf"});

  res = DecodeResult("{\"status\":\"error\",\"message\":\"PolicyViolation: no\"}\n");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, Outcome::ERROR);
  EXPECT_EQ(res->message, "PolicyViolation: no");
}

TEST(Protocol, DecodeRejects) {
  for (auto data : {"", "not json", "[]", "{}", R"({"status": "weird"})",
                    R"({"status": "success"})", R"({"status": "success", "files": [1]})",
                    R"({"status": "error"})", R"({"status": 1, "message": "x"})",
                    R"({"status": "success", "files": []} trailing)"}) {
    EXPECT_FALSE(DecodeResult(data)) << data;
  }
  EXPECT_FALSE(DecodeResult(std::string(kMaxChannelBytes + 1, ' ')));
}

TEST(ResultChannel, SingleUse) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  {
    ResultChannel channel(fds[1]);
    EXPECT_TRUE(channel.Report(ExecutionResult::Success({})));
    EXPECT_TRUE(channel.reported());
    EXPECT_FALSE(channel.Report(ExecutionResult::Error("second")));
    EXPECT_FALSE(channel.ReportFallback());
  }
  close(fds[1]);
  std::string data = ReadPipe(fds[0]);
  close(fds[0]);
  auto res = DecodeResult(data);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, Outcome::SUCCESS);
}

TEST(ResultChannel, Fallback) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  {
    ResultChannel channel(fds[1]);
    EXPECT_TRUE(channel.ReportFallback());
  }
  close(fds[1]);
  auto res = DecodeResult(ReadPipe(fds[0]));
  close(fds[0]);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, Outcome::ERROR);
  EXPECT_EQ(res->message.rfind("WorkerError:", 0), 0);
}
