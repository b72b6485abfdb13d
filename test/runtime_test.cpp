#include <cctype>
#include <csignal>
#include <gtest/gtest.h>

#include <docbox/utils.h>

#include "docbox/runtime.h"
#include "docbox/script_error.h"
#include "utils.h"

namespace {

void ExpectOk(const std::optional<ScriptFailure>& failure) {
  if (failure) FAIL() << DiagnosticKindName(failure->kind) << ": " << failure->message;
}

void ExpectFailure(const std::optional<ScriptFailure>& failure, DiagnosticKind kind,
                   const std::string& substr = "") {
  ASSERT_TRUE(failure);
  EXPECT_EQ(failure->kind, kind) << failure->message;
  EXPECT_NE(failure->message.find(substr), std::string::npos) << failure->message;
}

struct ImportParam {
  const char* name;
  bool allowed;
};

std::string ParamName(const ::testing::TestParamInfo<ImportParam>& info) {
  std::string ret = info.param.name;
  for (auto& c : ret) if (!isalnum((unsigned char)c)) c = '_';
  return ret + (info.param.allowed ? "_allowed" : "_denied");
}

} // namespace

class ImportGate : public testing::TestWithParam<ImportParam> {};
TEST_P(ImportGate, Require) {
  auto& param = GetParam();
  TempDir dir("import");
  auto failure = RunScript(std::string("local m = require('") + param.name + "')\n"
                           "assert(type(m) == 'table')", dir.path());
  if (param.allowed) {
    ExpectOk(failure);
  } else {
    ExpectFailure(failure, DiagnosticKind::IMPORT, param.name);
  }
}
INSTANTIATE_TEST_SUITE_P(Default, ImportGate,
    testing::Values(
      (ImportParam){"docx", true},
      (ImportParam){"pptx", true},
      (ImportParam){"canvas", true},
      (ImportParam){"os", true},
      (ImportParam){"os.path", true},
      (ImportParam){"json", true},
      (ImportParam){"datetime", true},
      (ImportParam){"string", true},
      (ImportParam){"socket", false},
      (ImportParam){"sys", false},
      (ImportParam){"io", false},
      (ImportParam){"debug", false},
      (ImportParam){"package", false},
      (ImportParam){"subprocess", false}
    ),
    ParamName);

TEST(Runtime, NamespaceIsRestricted) {
  TempDir dir("ns");
  ExpectOk(RunScript(R"(
assert(io == nil and debug == nil and package == nil and os == nil)
assert(load == nil and loadfile == nil and dofile == nil)
assert(string.dump == nil)
assert(docx == nil and pptx == nil and canvas == nil)
assert(type(json) == 'table' and type(re) == 'table' and type(random) == 'table')
assert(type(math) == 'table' and type(textwrap) == 'table' and type(buffer) == 'table')
local os = require('os')
assert(os.execute == nil and os.remove == nil and os.getenv == nil)
assert(os.path.basename('/a/b/c.txt') == 'c.txt')
assert(os.path.join('a', 'b') == 'a/b')
)", dir.path()));
}

TEST(Runtime, RequireMissingMember) {
  TempDir dir("ns");
  ExpectFailure(RunScript("require('os.execute')", dir.path()), DiagnosticKind::RUNTIME, "not found");
}

TEST(Runtime, PolicyRemovesModule) {
  TempDir dir("ns");
  Policy policy = Policy::Default().WithModules({"docx", "string"});
  ExpectOk(RunScript("assert(json == nil); assert(require('docx'))", dir.path(), policy));
  ExpectFailure(RunScript("require('json')", dir.path(), policy), DiagnosticKind::IMPORT);
}

TEST(Runtime, CaughtViolationIsSticky) {
  TempDir dir("sticky");
  auto failure = RunScript(R"(
local ok, err = pcall(require, 'socket')
assert(not ok)
local d = require('docx').Document()
d:add_paragraph('still running')
d:save('after.docx')
)", dir.path());
  ExpectFailure(failure, DiagnosticKind::IMPORT, "socket");
}

TEST(Runtime, CaughtExtensionViolationIsSticky) {
  TempDir dir("sticky");
  auto failure = RunScript(R"(
local c = require('canvas')
local ok = pcall(c.Canvas, 'evil.sh')
assert(not ok)
)", dir.path());
  ExpectFailure(failure, DiagnosticKind::POLICY, "evil.sh");
}

TEST(Runtime, ErrorObjectInScript) {
  TempDir dir("err");
  ExpectOk(RunScript(R"(
local ok, err = pcall(json.decode, '{')
assert(not ok)
assert(tostring(err):find('RuntimeError: ', 1, true) == 1)
assert(err.message:find('json.decode', 1, true))
)", dir.path()));
}

TEST(Runtime, ScriptError) {
  TempDir dir("err");
  auto failure = RunScript("local x = 1\nerror('boom')", dir.path());
  ExpectFailure(failure, DiagnosticKind::RUNTIME, "boom");
  EXPECT_NE(failure->trace.find("script:2"), std::string::npos) << failure->trace;
  EXPECT_EQ(failure->message.rfind("script:2:", 0), 0u) << failure->message;
}

TEST(Runtime, ErrorWithTable) {
  TempDir dir("err");
  ExpectFailure(RunScript("error({code = 1})", dir.path()), DiagnosticKind::RUNTIME, "table value");
}

TEST(Runtime, SyntaxError) {
  TempDir dir("err");
  ExpectFailure(RunScript("local = 1", dir.path()), DiagnosticKind::SYNTAX, "script:1");
  // binary chunks are refused
  ExpectFailure(RunScript("\x1bLua", dir.path()), DiagnosticKind::SYNTAX);
}

TEST(Runtime, MemoryLimit) {
  TempDir dir("mem");
  auto failure = RunScript(R"(
local t = {}
for i = 1, 100000000 do t[i] = string.rep('x', 64) .. i end
)", dir.path(), Policy::Default(), 16 << 20);
  ExpectFailure(failure, DiagnosticKind::MEMORY);
}

TEST(Runtime, Interrupt) {
  TempDir dir("int");
  volatile sig_atomic_t flag = 1;
  Policy policy = Policy::Default();
  Runtime runtime(policy, dir.path(), 0, &flag);
  auto failure = runtime.Execute("local ok = pcall(function() while true do end end)\nwhile true do end");
  ExpectFailure(failure, DiagnosticKind::INTERRUPTED);
}

TEST(Runtime, PrepareIdempotent) {
  TempDir dir("prep");
  Policy policy = Policy::Default();
  Runtime runtime(policy, dir.path(), 64 << 20);
  EXPECT_FALSE(runtime.Prepare());
  size_t used = runtime.memory_used();
  EXPECT_FALSE(runtime.Prepare());
  EXPECT_EQ(runtime.memory_used(), used);
  EXPECT_EQ(&runtime.Confiner("docx"), &runtime.Confiner("docx"));
  EXPECT_EQ(runtime.Confiner("canvas").job_dir(), dir.path());
  EXPECT_THROW(runtime.Confiner("os"), ScriptError);
}

TEST(Runtime, CollectGarbageRestricted) {
  TempDir dir("gc");
  ExpectOk(RunScript("collectgarbage(); assert(collectgarbage('count') > 0)", dir.path()));
  ExpectFailure(RunScript("collectgarbage('stop')", dir.path()), DiagnosticKind::RUNTIME, "not allowed");
}

TEST(Runtime, PrintIsBounded) {
  TempDir dir("print");
  Policy policy = Policy::Default();
  Runtime runtime(policy, dir.path(), 64 << 20);
  ExpectOk(runtime.Execute("for i = 1, 10000 do print(string.rep('y', 100), i) end"));
  EXPECT_EQ(runtime.console_bytes(), 64u << 10);
}

TEST(Prelude, Utilities) {
  TempDir dir("prelude");
  ExpectOk(RunScript(R"(
assert(json.encode({1, 2, 3}) == '[1,2,3]')
assert(json.encode({}) == '{}')
local obj = json.decode('{"a": [1, 2, null], "b": "x"}')
assert(obj.a[2] == 2 and obj.a[3] == json.null and obj.b == 'x')
local s, n = re.sub('(\\d+)', '<$1>', 'a1b22c')
assert(s == 'a<1>b<22>c' and n == 2)
assert(#re.findall('\\w+', 'one two three') == 3)
assert(re.match('b', 'abc') == nil and re.search('b', 'abc').start == 2)
assert(base64.encode('hello') == 'aGVsbG8=' and base64.decode('aGVsbG8=') == 'hello')
assert(textwrap.dedent('  a\n  b') == 'a\nb')
assert(#textwrap.wrap('aaa bbb ccc', 7) == 2)
local b = buffer.new()
b:write('hello world')
b:seek(0)
assert(b:read(5) == 'hello' and b:tell() == 5 and b:len() == 11)
random.seed(42)
local x = random.randint(1, 6)
random.seed(42)
assert(random.randint(1, 6) == x)
local now = datetime.utcnow()
assert(now.year >= 2020 and now:strftime('%Y') == tostring(now.year))
)", dir.path()));
}

TEST(Prelude, OsPath) {
  TempDir dir("prelude");
  ExpectOk(RunScript(R"(
local os = require('os')
assert(os.getenv == nil and os.execute == nil and os.remove == nil)
local path = require('os.path')
assert(path == os.path)
assert(path.basename('/a/b/c.pdf') == 'c.pdf' and path.dirname('/a/b/c.pdf') == '/a/b')
assert(path.join('a', 'b', 'c.txt') == 'a/b/c.txt' and path.join('a', '/b') == '/b')
local stem, ext = path.splitext('dir/report.tar.gz')
assert(stem == 'dir/report.tar' and ext == '.gz')
assert(select(2, path.splitext('.bashrc')) == '')
assert(path.normpath('/a/./b/../c//d') == '/a/c/d' and path.normpath('../x/..') == '..')
assert(path.isabs('/x') and not path.isabs('x'))
)", dir.path()));
}

TEST(Prelude, RegexSubjectLimit) {
  TempDir dir("prelude");
  ExpectOk(RunScript("assert(re.match('(a|b)*c', string.rep('a', 1000) .. 'c'))", dir.path()));
  ExpectFailure(RunScript("re.match('(a|b)*c', string.rep('a', 200000))", dir.path()),
                DiagnosticKind::RUNTIME, "subject exceeds");
  ExpectFailure(RunScript("re.sub('a', 'b', string.rep('a', 5000))", dir.path()),
                DiagnosticKind::RUNTIME, "subject exceeds");
}

TEST(Prelude, TimestampRange) {
  TempDir dir("prelude");
  ExpectOk(RunScript(R"(
local now = datetime.utcnow()
for _, t in ipairs({1/0, -1/0, 0/0, 1e300, -1e300}) do
  local ok, err = pcall(datetime.format, '%Y', t)
  assert(not ok and tostring(err):find('timestamp out of range'), tostring(err))
  now.timestamp = t
  ok, err = pcall(now.strftime, now, '%Y')
  assert(not ok and tostring(err):find('timestamp out of range'), tostring(err))
end
assert(datetime.format('%Y', 1e9) == '2001')
)", dir.path()));
  ExpectFailure(RunScript("datetime.format('%Y', 1/0)", dir.path()),
                DiagnosticKind::RUNTIME, "timestamp out of range");
}
