#include "modules.h"

#include <ctime>
#include <cstring>
#include <optional>
#include <functional>
#include <regex>
#include <random>
#include <chrono>
#include <algorithm>

#include <nlohmann/json.hpp>

#include "utils.h"
#include "lua_utils.h"

namespace {

/// random

const char kRandomMetatable[] = "docbox.random";

struct RandomState {
  std::mt19937_64 gen;
};

std::mt19937_64& Generator(lua_State* L) {
  return static_cast<RandomState*>(lua_touserdata(L, lua_upvalueindex(1)))->gen;
}

int RandomSeed(lua_State* L) {
  if (lua_isnoneornil(L, 1)) {
    std::random_device rd;
    Generator(L).seed((uint64_t)rd() << 32 | rd());
  } else if (lua_type(L, 1) == LUA_TSTRING) {
    Generator(L).seed(std::hash<std::string>()(ArgString(L, 1, "seed")));
  } else {
    Generator(L).seed((uint64_t)ArgInteger(L, 1, "seed"));
  }
  return 0;
}

int RandomRandom(lua_State* L) {
  lua_pushnumber(L, std::uniform_real_distribution<double>(0.0, 1.0)(Generator(L)));
  return 1;
}

int RandomRandint(lua_State* L) {
  lua_Integer a = ArgInteger(L, 1, "randint"), b = ArgInteger(L, 2, "randint");
  if (a > b) throw ScriptError(DiagnosticKind::RUNTIME, "empty range for randint");
  lua_pushinteger(L, std::uniform_int_distribution<lua_Integer>(a, b)(Generator(L)));
  return 1;
}

int RandomUniform(lua_State* L) {
  double a = ArgNumber(L, 1, "uniform"), b = ArgNumber(L, 2, "uniform");
  double x = std::uniform_real_distribution<double>(0.0, 1.0)(Generator(L));
  lua_pushnumber(L, a + (b - a) * x);
  return 1;
}

int RandomChoice(lua_State* L) {
  ArgTable(L, 1, "choice");
  lua_Unsigned n = lua_rawlen(L, 1);
  if (!n) throw ScriptError(DiagnosticKind::RUNTIME, "cannot choose from an empty sequence");
  lua_Unsigned idx = std::uniform_int_distribution<lua_Unsigned>(1, n)(Generator(L));
  lua_rawgeti(L, 1, idx);
  return 1;
}

int RandomShuffle(lua_State* L) {
  ArgTable(L, 1, "shuffle");
  lua_Unsigned n = lua_rawlen(L, 1);
  for (lua_Unsigned i = n; i > 1; i--) {
    lua_Unsigned j = std::uniform_int_distribution<lua_Unsigned>(1, i)(Generator(L));
    lua_rawgeti(L, 1, i);
    lua_rawgeti(L, 1, j);
    lua_rawseti(L, 1, i);
    lua_rawseti(L, 1, j);
  }
  return 0;
}

int RandomSample(lua_State* L) {
  ArgTable(L, 1, "sample");
  lua_Integer n = lua_rawlen(L, 1);
  lua_Integer k = ArgInteger(L, 2, "sample");
  if (k < 0 || k > n) throw ScriptError(DiagnosticKind::RUNTIME, "sample larger than population or is negative");
  std::vector<lua_Integer> idx(n);
  for (lua_Integer i = 0; i < n; i++) idx[i] = i + 1;
  auto& gen = Generator(L);
  for (lua_Integer i = 0; i < k; i++) {
    std::swap(idx[i], idx[std::uniform_int_distribution<lua_Integer>(i, n - 1)(gen)]);
  }
  lua_createtable(L, k, 0);
  for (lua_Integer i = 0; i < k; i++) {
    lua_rawgeti(L, 1, idx[i]);
    lua_rawseti(L, -2, i + 1);
  }
  return 1;
}

/// datetime

const char kDatetimeMetatable[] = "docbox.datetime";
constexpr size_t kMaxFormatLength = 256;

std::string FormatTime(const std::string& fmt, const struct tm& tm) {
  if (fmt.size() > kMaxFormatLength) throw ScriptError(DiagnosticKind::RUNTIME, "format string too long");
  if (fmt.empty()) return "";
  char buf[1024];
  size_t len = strftime(buf, sizeof(buf), fmt.c_str(), &tm);
  if (!len) throw ScriptError(DiagnosticKind::RUNTIME, "formatted time too long");
  return std::string(buf, len);
}

// years 1 through 9999
constexpr double kMinTimestamp = -62135596800.0;
constexpr double kMaxTimestamp = 253402300799.0;

struct tm ToTm(double timestamp, bool utc) {
  if (!(timestamp >= kMinTimestamp && timestamp <= kMaxTimestamp)) {
    throw ScriptError(DiagnosticKind::RUNTIME, "timestamp out of range");
  }
  time_t t = (time_t)timestamp;
  struct tm tm{};
  if (!(utc ? gmtime_r(&t, &tm) : localtime_r(&t, &tm))) {
    throw ScriptError(DiagnosticKind::RUNTIME, "timestamp out of range");
  }
  return tm;
}

double Now() {
  using namespace std::chrono;
  return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count() / 1e6;
}

void PushDatetime(lua_State* L, double timestamp, bool utc, bool date_only) {
  struct tm tm = ToTm(timestamp, utc);
  lua_createtable(L, 0, 10);
  auto set = [L](const char* key, lua_Integer val) {
    lua_pushinteger(L, val);
    lua_setfield(L, -2, key);
  };
  set("year", tm.tm_year + 1900);
  set("month", tm.tm_mon + 1);
  set("day", tm.tm_mday);
  set("hour", date_only ? 0 : tm.tm_hour);
  set("minute", date_only ? 0 : tm.tm_min);
  set("second", date_only ? 0 : tm.tm_sec);
  set("microsecond", date_only ? 0 : (lua_Integer)((timestamp - (time_t)timestamp) * 1e6));
  // Monday is 0
  set("weekday", (tm.tm_wday + 6) % 7);
  if (date_only) timestamp = (time_t)timestamp - (tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec);
  lua_pushnumber(L, timestamp);
  lua_setfield(L, -2, "timestamp");
  lua_pushboolean(L, utc);
  lua_setfield(L, -2, "utc");
  luaL_setmetatable(L, kDatetimeMetatable);
}

// the receiver of datetime methods; a table built by PushDatetime
struct tm DatetimeArg(lua_State* L, const char* fname) {
  ArgTable(L, 1, fname);
  double timestamp = FieldNumber(L, 1, "timestamp", 0);
  return ToTm(timestamp, FieldBoolean(L, 1, "utc", false));
}

int DatetimeNow(lua_State* L) {
  PushDatetime(L, Now(), false, false);
  return 1;
}

int DatetimeUtcnow(lua_State* L) {
  PushDatetime(L, Now(), true, false);
  return 1;
}

int DatetimeToday(lua_State* L) {
  PushDatetime(L, Now(), false, true);
  return 1;
}

int DatetimeTime(lua_State* L) {
  lua_pushnumber(L, Now());
  return 1;
}

int DatetimeFormat(lua_State* L) {
  std::string fmt = ArgString(L, 1, "format");
  double timestamp = OptNumber(L, 2, "format", Now());
  std::string ret = FormatTime(fmt, ToTm(timestamp, false));
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int DatetimeStrftime(lua_State* L) {
  struct tm tm = DatetimeArg(L, "strftime");
  std::string ret = FormatTime(ArgString(L, 2, "strftime"), tm);
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int DatetimeIsoformat(lua_State* L) {
  struct tm tm = DatetimeArg(L, "isoformat");
  std::string ret = FormatTime("%Y-%m-%dT%H:%M:%S", tm);
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

/// re

constexpr size_t kMaxPatternLength = 4096;
// std::regex matching recurses once per subject character on the native stack
constexpr size_t kMaxSubjectLength = 4 << 10;
constexpr size_t kMaxResultLength = 1 << 20;

std::regex CompileRegex(const std::string& pattern) {
  if (pattern.size() > kMaxPatternLength) throw ScriptError(DiagnosticKind::RUNTIME, "pattern too long");
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (std::regex_error& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("invalid regular expression: ") + e.what());
  }
}

std::string Subject(lua_State* L, int idx, const char* fname) {
  std::string ret = ArgString(L, idx, fname);
  if (ret.size() > kMaxSubjectLength) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string(fname) + ": subject exceeds " +
                      std::to_string(kMaxSubjectLength) + " bytes");
  }
  return ret;
}

// {[1..n] = groups, match = whole, start =, stop =}; positions are 1-based inclusive
void PushMatch(lua_State* L, const std::smatch& m, size_t offset) {
  lua_createtable(L, m.size() - 1, 3);
  for (size_t i = 1; i < m.size(); i++) {
    if (m[i].matched) {
      std::string str = m[i].str();
      lua_pushlstring(L, str.data(), str.size());
    } else {
      lua_pushboolean(L, 0);
    }
    lua_rawseti(L, -2, i);
  }
  std::string whole = m[0].str();
  lua_pushlstring(L, whole.data(), whole.size());
  lua_setfield(L, -2, "match");
  lua_pushinteger(L, offset + m.position(0) + 1);
  lua_setfield(L, -2, "start");
  lua_pushinteger(L, offset + m.position(0) + m.length(0));
  lua_setfield(L, -2, "stop");
}

int MatchOrSearch(lua_State* L, bool anchored, const char* fname) {
  std::regex re = CompileRegex(ArgString(L, 1, fname));
  std::string subject = Subject(L, 2, fname);
  std::smatch m;
  auto flags = anchored ? std::regex_constants::match_continuous : std::regex_constants::match_default;
  try {
    if (!std::regex_search(subject, m, re, flags)) {
      lua_pushnil(L);
      return 1;
    }
  } catch (std::regex_error& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("regular expression failed: ") + e.what());
  }
  PushMatch(L, m, 0);
  return 1;
}

int ReMatch(lua_State* L) { return MatchOrSearch(L, true, "match"); }
int ReSearch(lua_State* L) { return MatchOrSearch(L, false, "search"); }

int ReFindall(lua_State* L) {
  std::regex re = CompileRegex(ArgString(L, 1, "findall"));
  std::string subject = Subject(L, 2, "findall");
  lua_newtable(L);
  lua_Integer n = 0;
  try {
    for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re);
         it != std::sregex_iterator(); ++it) {
      auto& m = *it;
      if (m.size() == 1) {
        std::string str = m[0].str();
        lua_pushlstring(L, str.data(), str.size());
      } else if (m.size() == 2) {
        std::string str = m[1].str();
        lua_pushlstring(L, str.data(), str.size());
      } else {
        lua_createtable(L, m.size() - 1, 0);
        for (size_t i = 1; i < m.size(); i++) {
          std::string str = m[i].str();
          lua_pushlstring(L, str.data(), str.size());
          lua_rawseti(L, -2, i);
        }
      }
      lua_rawseti(L, -2, ++n);
    }
  } catch (std::regex_error& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("regular expression failed: ") + e.what());
  }
  return 1;
}

// repl uses ECMAScript format: $1, $&
int ReSub(lua_State* L) {
  std::regex re = CompileRegex(ArgString(L, 1, "sub"));
  std::string repl = ArgString(L, 2, "sub");
  std::string subject = Subject(L, 3, "sub");
  lua_Integer count = OptInteger(L, 4, "sub", 0);
  std::string ret;
  lua_Integer done = 0;
  try {
    auto last = subject.cbegin();
    for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re);
         it != std::sregex_iterator() && (count <= 0 || done < count); ++it, ++done) {
      ret.append(last, (*it)[0].first);
      ret += it->format(repl);
      last = (*it)[0].second;
      if (ret.size() > kMaxResultLength) throw ScriptError(DiagnosticKind::RUNTIME, "result too long");
    }
    ret.append(last, subject.cend());
  } catch (std::regex_error& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("regular expression failed: ") + e.what());
  }
  lua_pushlstring(L, ret.data(), ret.size());
  lua_pushinteger(L, done);
  return 2;
}

int ReSplit(lua_State* L) {
  std::regex re = CompileRegex(ArgString(L, 1, "split"));
  std::string subject = Subject(L, 2, "split");
  lua_Integer maxsplit = OptInteger(L, 3, "split", 0);
  std::vector<std::string> parts;
  try {
    auto last = subject.cbegin();
    lua_Integer done = 0;
    for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re);
         it != std::sregex_iterator() && (maxsplit <= 0 || done < maxsplit); ++it) {
      if ((*it)[0].length() == 0) continue;
      parts.emplace_back(last, (*it)[0].first);
      last = (*it)[0].second;
      done++;
    }
    parts.emplace_back(last, subject.cend());
  } catch (std::regex_error& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("regular expression failed: ") + e.what());
  }
  lua_createtable(L, parts.size(), 0);
  for (size_t i = 0; i < parts.size(); i++) {
    lua_pushlstring(L, parts[i].data(), parts[i].size());
    lua_rawseti(L, -2, i + 1);
  }
  return 1;
}

/// json

constexpr int kMaxJsonDepth = 128;

// json.null is a light userdata pointing here
const char kJsonNullTag = 0;

void* JsonNull() {
  return const_cast<char*>(&kJsonNullTag);
}

bool IsJsonNull(lua_State* L, int idx) {
  return lua_type(L, idx) == LUA_TLIGHTUSERDATA && lua_touserdata(L, idx) == JsonNull();
}

nlohmann::json ToJson(lua_State* L, int idx, int depth) {
  if (depth > kMaxJsonDepth) throw ScriptError(DiagnosticKind::RUNTIME, "json.encode: nesting too deep (cycle?)");
  idx = lua_absindex(L, idx);
  switch (lua_type(L, idx)) {
    case LUA_TNIL: return nullptr;
    case LUA_TBOOLEAN: return (bool)lua_toboolean(L, idx);
    case LUA_TNUMBER:
      if (lua_isinteger(L, idx)) return (int64_t)lua_tointeger(L, idx);
      return lua_tonumber(L, idx);
    case LUA_TSTRING: {
      size_t len;
      const char* str = lua_tolstring(L, idx, &len);
      return std::string(str, len);
    }
    case LUA_TLIGHTUSERDATA:
      if (IsJsonNull(L, idx)) return nullptr;
      break;
    case LUA_TTABLE: {
      if (!lua_checkstack(L, 3)) throw ScriptError(DiagnosticKind::MEMORY, "stack overflow");
      lua_Unsigned len = lua_rawlen(L, idx);
      size_t count = 0;
      bool sequence = true;
      lua_pushnil(L);
      while (lua_next(L, idx)) {
        count++;
        if (!lua_isinteger(L, -2) || lua_tointeger(L, -2) < 1 ||
            (lua_Unsigned)lua_tointeger(L, -2) > len) {
          sequence = false;
        }
        lua_pop(L, 1);
      }
      if (len && sequence && count == len) {
        nlohmann::json ret = nlohmann::json::array();
        for (lua_Unsigned i = 1; i <= len; i++) {
          lua_rawgeti(L, idx, i);
          ret.push_back(ToJson(L, -1, depth + 1));
          lua_pop(L, 1);
        }
        return ret;
      }
      nlohmann::json ret = nlohmann::json::object();
      lua_pushnil(L);
      while (lua_next(L, idx)) {
        std::string key;
        if (lua_type(L, -2) == LUA_TSTRING) {
          size_t klen;
          const char* kstr = lua_tolstring(L, -2, &klen);
          key.assign(kstr, klen);
        } else if (lua_type(L, -2) == LUA_TNUMBER) {
          // tostring on a copy so that lua_next still sees the number
          lua_pushvalue(L, -2);
          key = lua_tostring(L, -1);
          lua_pop(L, 1);
        } else {
          lua_pop(L, 2);
          throw ScriptError(DiagnosticKind::RUNTIME, "json.encode: keys must be strings or numbers");
        }
        ret[key] = ToJson(L, -1, depth + 1);
        lua_pop(L, 1);
      }
      return ret;
    }
  }
  throw ScriptError(DiagnosticKind::RUNTIME,
      std::string("json.encode: ") + luaL_typename(L, idx) + " is not JSON serializable");
}

void PushJson(lua_State* L, const nlohmann::json& obj) {
  if (!lua_checkstack(L, 3)) throw ScriptError(DiagnosticKind::MEMORY, "stack overflow");
  switch (obj.type()) {
    case nlohmann::json::value_t::null:
      lua_pushlightuserdata(L, JsonNull());
      return;
    case nlohmann::json::value_t::boolean:
      lua_pushboolean(L, obj.get<bool>());
      return;
    case nlohmann::json::value_t::number_integer:
      lua_pushinteger(L, obj.get<int64_t>());
      return;
    case nlohmann::json::value_t::number_unsigned:
      if (obj.get<uint64_t>() > (uint64_t)LUA_MAXINTEGER) {
        lua_pushnumber(L, (double)obj.get<uint64_t>());
      } else {
        lua_pushinteger(L, (lua_Integer)obj.get<uint64_t>());
      }
      return;
    case nlohmann::json::value_t::number_float:
      lua_pushnumber(L, obj.get<double>());
      return;
    case nlohmann::json::value_t::string: {
      auto& str = obj.get_ref<const std::string&>();
      lua_pushlstring(L, str.data(), str.size());
      return;
    }
    case nlohmann::json::value_t::array: {
      lua_createtable(L, obj.size(), 0);
      lua_Integer i = 0;
      for (auto& item : obj) {
        PushJson(L, item);
        lua_rawseti(L, -2, ++i);
      }
      return;
    }
    case nlohmann::json::value_t::object:
      lua_createtable(L, 0, obj.size());
      for (auto& [key, value] : obj.items()) {
        lua_pushlstring(L, key.data(), key.size());
        PushJson(L, value);
        lua_rawset(L, -3);
      }
      return;
    default:
      lua_pushnil(L);
  }
}

int JsonEncode(lua_State* L) {
  lua_Integer indent = OptInteger(L, 2, "encode", -1);
  if (indent > 16) indent = 16;
  nlohmann::json obj = ToJson(L, 1, 0);
  std::string ret = obj.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int JsonDecode(lua_State* L) {
  std::string str = ArgString(L, 1, "decode");
  nlohmann::json obj;
  try {
    obj = nlohmann::json::parse(str, [](int depth, nlohmann::json::parse_event_t, nlohmann::json&) {
      if (depth > kMaxJsonDepth) throw ScriptError(DiagnosticKind::RUNTIME, "json.decode: nesting too deep");
      return true;
    });
  } catch (nlohmann::json::exception& e) {
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("json.decode: ") + e.what());
  }
  PushJson(L, obj);
  return 1;
}

/// textwrap; widths count code points

std::vector<std::string> SplitWords(const std::string& text) {
  std::vector<std::string> ret;
  std::string cur;
  for (char c : text) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      if (cur.size()) ret.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (cur.size()) ret.push_back(std::move(cur));
  return ret;
}

// split a word longer than width into width-sized pieces
std::vector<std::string> BreakWord(const std::string& word, size_t width) {
  std::vector<std::string> ret;
  std::string cur;
  size_t len = 0;
  for (size_t i = 0; i < word.size();) {
    size_t clen = 1;
    while (i + clen < word.size() && ((unsigned char)word[i + clen] & 0xC0) == 0x80) clen++;
    if (len == width) {
      ret.push_back(std::move(cur));
      cur.clear();
      len = 0;
    }
    cur.append(word, i, clen);
    len++;
    i += clen;
  }
  if (cur.size()) ret.push_back(std::move(cur));
  return ret;
}

std::vector<std::string> WrapText(const std::string& text, lua_Integer width) {
  if (width <= 0) throw ScriptError(DiagnosticKind::RUNTIME, "invalid width (must be > 0)");
  std::vector<std::string> lines;
  std::string line;
  size_t line_len = 0;
  for (auto& word : SplitWords(text)) {
    for (auto& piece : BreakWord(word, width)) {
      size_t len = Utf8Length(piece);
      if (line_len && line_len + 1 + len > (size_t)width) {
        lines.push_back(std::move(line));
        line.clear();
        line_len = 0;
      }
      if (line_len) {
        line.push_back(' ');
        line_len++;
      }
      line += piece;
      line_len += len;
    }
  }
  if (line.size()) lines.push_back(std::move(line));
  return lines;
}

void PushStringList(lua_State* L, const std::vector<std::string>& list) {
  lua_createtable(L, list.size(), 0);
  for (size_t i = 0; i < list.size(); i++) {
    lua_pushlstring(L, list[i].data(), list[i].size());
    lua_rawseti(L, -2, i + 1);
  }
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) {
      if (pos < text.size()) ret.push_back(text.substr(pos));
      break;
    }
    ret.push_back(text.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return ret;
}

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

int TextwrapWrap(lua_State* L) {
  std::string text = ArgString(L, 1, "wrap");
  PushStringList(L, WrapText(text, OptInteger(L, 2, "wrap", 70)));
  return 1;
}

int TextwrapFill(lua_State* L) {
  std::string text = ArgString(L, 1, "fill");
  std::string ret;
  for (auto& i : WrapText(text, OptInteger(L, 2, "fill", 70))) {
    if (ret.size()) ret.push_back('\n');
    ret += i;
  }
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int TextwrapDedent(lua_State* L) {
  auto lines = SplitLines(ArgString(L, 1, "dedent"));
  std::optional<std::string> margin;
  for (auto& line : lines) {
    if (IsBlank(line)) continue;
    std::string indent = line.substr(0, line.find_first_not_of(" \t"));
    if (!margin) {
      margin = indent;
    } else {
      size_t n = 0;
      while (n < margin->size() && n < indent.size() && (*margin)[n] == indent[n]) n++;
      margin->resize(n);
    }
  }
  std::string ret;
  for (auto& line : lines) {
    if (IsBlank(line)) {
      ret += line.back() == '\n' ? "\n" : "";
    } else {
      ret += line.substr(margin ? margin->size() : 0);
    }
  }
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int TextwrapIndent(lua_State* L) {
  auto lines = SplitLines(ArgString(L, 1, "indent"));
  std::string prefix = ArgString(L, 2, "indent");
  std::string ret;
  for (auto& line : lines) {
    if (!IsBlank(line)) ret += prefix;
    ret += line;
  }
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int TextwrapShorten(lua_State* L) {
  auto words = SplitWords(ArgString(L, 1, "shorten"));
  lua_Integer width = ArgInteger(L, 2, "shorten");
  if (width <= 0) throw ScriptError(DiagnosticKind::RUNTIME, "invalid width (must be > 0)");
  std::string placeholder = OptString(L, 3, "shorten").value_or(" [...]");
  std::string full;
  for (auto& i : words) {
    if (full.size()) full.push_back(' ');
    full += i;
  }
  if (Utf8Length(full) <= (size_t)width) {
    lua_pushlstring(L, full.data(), full.size());
    return 1;
  }
  size_t placeholder_len = Utf8Length(placeholder);
  if (placeholder_len > (size_t)width) throw ScriptError(DiagnosticKind::RUNTIME, "placeholder too large for max width");
  std::string ret;
  for (auto& i : words) {
    size_t len = Utf8Length(ret) + (ret.size() ? 1 : 0) + Utf8Length(i);
    if (len + placeholder_len > (size_t)width) break;
    if (ret.size()) ret.push_back(' ');
    ret += i;
  }
  // a leading space of the placeholder is dropped when nothing precedes it
  if (ret.empty() && placeholder.size() && placeholder[0] == ' ') placeholder.erase(0, 1);
  ret += placeholder;
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

/// base64

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int Base64Encode(lua_State* L) {
  std::string data = ArgString(L, 1, "encode");
  std::string ret;
  ret.reserve((data.size() + 2) / 3 * 4);
  for (size_t i = 0; i < data.size(); i += 3) {
    uint32_t n = (unsigned char)data[i] << 16;
    if (i + 1 < data.size()) n |= (unsigned char)data[i + 1] << 8;
    if (i + 2 < data.size()) n |= (unsigned char)data[i + 2];
    ret.push_back(kBase64Chars[n >> 18 & 63]);
    ret.push_back(kBase64Chars[n >> 12 & 63]);
    ret.push_back(i + 1 < data.size() ? kBase64Chars[n >> 6 & 63] : '=');
    ret.push_back(i + 2 < data.size() ? kBase64Chars[n & 63] : '=');
  }
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

int Base64Decode(lua_State* L) {
  std::string data = ArgString(L, 1, "decode");
  std::string ret;
  uint32_t acc = 0;
  int bits = 0;
  size_t padding = 0;
  for (char c : data) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') {
      padding++;
      continue;
    }
    const char* pos = strchr(kBase64Chars, c);
    if (!c || !pos || padding) throw ScriptError(DiagnosticKind::RUNTIME, "base64.decode: invalid input");
    acc = acc << 6 | (pos - kBase64Chars);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      ret.push_back((char)(acc >> bits & 0xFF));
    }
  }
  if (bits >= 6 || padding > 2) throw ScriptError(DiagnosticKind::RUNTIME, "base64.decode: invalid input");
  lua_pushlstring(L, ret.data(), ret.size());
  return 1;
}

/// buffer; an in-memory file

const char kBufferMetatable[] = "docbox.buffer";
constexpr size_t kMaxBufferSize = 64 << 20;

struct Buffer {
  std::string data;
  size_t pos = 0;
};

Buffer* CheckBuffer(lua_State* L, const char* fname) {
  return CheckObject<Buffer>(L, 1, kBufferMetatable, fname);
}

int BufferNew(lua_State* L) {
  auto init = OptString(L, 1, "new");
  if (init && init->size() > kMaxBufferSize) throw ScriptError(DiagnosticKind::MEMORY, "buffer too large");
  Buffer* buf = NewObject<Buffer>(L, kBufferMetatable);
  if (init) buf->data = std::move(*init);
  return 1;
}

int BufferWrite(lua_State* L) {
  Buffer* buf = CheckBuffer(L, "write");
  std::string data = ArgString(L, 2, "write");
  if (buf->pos + data.size() > kMaxBufferSize) throw ScriptError(DiagnosticKind::MEMORY, "buffer too large");
  if (buf->pos > buf->data.size()) buf->data.resize(buf->pos, '\0');
  buf->data.replace(buf->pos, std::min(data.size(), buf->data.size() - buf->pos), data);
  buf->pos += data.size();
  lua_pushinteger(L, data.size());
  return 1;
}

int BufferRead(lua_State* L) {
  Buffer* buf = CheckBuffer(L, "read");
  lua_Integer n = OptInteger(L, 2, "read", -1);
  size_t avail = buf->pos < buf->data.size() ? buf->data.size() - buf->pos : 0;
  size_t len = n < 0 ? avail : std::min<size_t>(n, avail);
  lua_pushlstring(L, buf->data.data() + std::min(buf->pos, buf->data.size()), len);
  buf->pos += len;
  return 1;
}

// whence: 0 start, 1 current, 2 end; positions are 0-based
int BufferSeek(lua_State* L) {
  Buffer* buf = CheckBuffer(L, "seek");
  lua_Integer offset = ArgInteger(L, 2, "seek");
  lua_Integer whence = OptInteger(L, 3, "seek", 0);
  lua_Integer base;
  switch (whence) {
    case 0: base = 0; break;
    case 1: base = buf->pos; break;
    case 2: base = buf->data.size(); break;
    default: throw ScriptError(DiagnosticKind::RUNTIME, "invalid whence");
  }
  if (base + offset < 0 || base + offset > (lua_Integer)kMaxBufferSize) {
    throw ScriptError(DiagnosticKind::RUNTIME, "seek position out of range");
  }
  buf->pos = base + offset;
  lua_pushinteger(L, buf->pos);
  return 1;
}

int BufferTell(lua_State* L) {
  lua_pushinteger(L, CheckBuffer(L, "tell")->pos);
  return 1;
}

int BufferGetvalue(lua_State* L) {
  Buffer* buf = CheckBuffer(L, "getvalue");
  lua_pushlstring(L, buf->data.data(), buf->data.size());
  return 1;
}

int BufferLen(lua_State* L) {
  lua_pushinteger(L, CheckBuffer(L, "len")->data.size());
  return 1;
}

/// os.path; POSIX path strings only, nothing touches the file system

std::string PathBasename(const std::string& path) {
  size_t sep = path.rfind('/');
  return sep == std::string::npos ? path : path.substr(sep + 1);
}

std::string PathDirname(const std::string& path) {
  size_t sep = path.rfind('/');
  if (sep == std::string::npos) return "";
  std::string head = path.substr(0, sep + 1);
  if (head.find_first_not_of('/') != std::string::npos) {
    while (head.size() && head.back() == '/') head.pop_back();
  }
  return head;
}

std::string PathNormpath(const std::string& path) {
  if (path.empty()) return ".";
  bool absolute = path[0] == '/';
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find('/', pos);
    if (end == std::string::npos) end = path.size();
    std::string comp = path.substr(pos, end - pos);
    if (comp.empty() || comp == ".") {
      // skip
    } else if (comp == "..") {
      if (parts.size() && parts.back() != "..") {
        parts.pop_back();
      } else if (!absolute) {
        parts.push_back(comp);
      }
    } else {
      parts.push_back(comp);
    }
    pos = end + 1;
  }
  std::string ret = absolute ? "/" : "";
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) ret.push_back('/');
    ret += parts[i];
  }
  return ret.empty() ? "." : ret;
}

void PushString(lua_State* L, const std::string& str) {
  lua_pushlstring(L, str.data(), str.size());
}

int PathBasenameLua(lua_State* L) {
  PushString(L, PathBasename(ArgString(L, 1, "basename")));
  return 1;
}

int PathDirnameLua(lua_State* L) {
  PushString(L, PathDirname(ArgString(L, 1, "dirname")));
  return 1;
}

int PathJoin(lua_State* L) {
  int n = lua_gettop(L);
  std::string ret = ArgString(L, 1, "join");
  for (int i = 2; i <= n; i++) {
    std::string part = ArgString(L, i, "join");
    if (part.size() && part[0] == '/') {
      ret = part;
    } else if (ret.empty() || ret.back() == '/') {
      ret += part;
    } else {
      ret += "/" + part;
    }
  }
  PushString(L, ret);
  return 1;
}

int PathSplitext(lua_State* L) {
  std::string path = ArgString(L, 1, "splitext");
  size_t sep = path.rfind('/');
  size_t start = sep == std::string::npos ? 0 : sep + 1;
  // leading dots of the base name do not start an extension
  size_t stem = path.find_first_not_of('.', start);
  size_t dot = path.rfind('.');
  if (stem == std::string::npos || dot == std::string::npos || dot < stem) {
    PushString(L, path);
    lua_pushliteral(L, "");
  } else {
    PushString(L, path.substr(0, dot));
    PushString(L, path.substr(dot));
  }
  return 2;
}

int PathNormpathLua(lua_State* L) {
  PushString(L, PathNormpath(ArgString(L, 1, "normpath")));
  return 1;
}

int PathIsabs(lua_State* L) {
  std::string path = ArgString(L, 1, "isabs");
  lua_pushboolean(L, path.size() && path[0] == '/');
  return 1;
}

} // namespace

int OpenRandomModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"seed", Guarded<RandomSeed>},
    {"random", Guarded<RandomRandom>},
    {"randint", Guarded<RandomRandint>},
    {"uniform", Guarded<RandomUniform>},
    {"choice", Guarded<RandomChoice>},
    {"shuffle", Guarded<RandomShuffle>},
    {"sample", Guarded<RandomSample>},
    {nullptr, nullptr},
  };
  static const luaL_Reg no_methods[] = {{nullptr, nullptr}};
  RegisterClass(L, kRandomMetatable, no_methods, DestroyObject<RandomState>);
  lua_newtable(L);
  RandomState* state = NewObject<RandomState>(L, kRandomMetatable);
  std::random_device rd;
  state->gen.seed((uint64_t)rd() << 32 | rd());
  luaL_setfuncs(L, funcs, 1);
  return 1;
}

int OpenDatetimeModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"now", Guarded<DatetimeNow>},
    {"utcnow", Guarded<DatetimeUtcnow>},
    {"today", Guarded<DatetimeToday>},
    {"time", Guarded<DatetimeTime>},
    {"format", Guarded<DatetimeFormat>},
    {nullptr, nullptr},
  };
  static const luaL_Reg methods[] = {
    {"strftime", Guarded<DatetimeStrftime>},
    {"isoformat", Guarded<DatetimeIsoformat>},
    {nullptr, nullptr},
  };
  RegisterClass(L, kDatetimeMetatable, methods, nullptr);
  luaL_getmetatable(L, kDatetimeMetatable);
  lua_pushcfunction(L, Guarded<DatetimeIsoformat>);
  lua_setfield(L, -2, "__tostring");
  lua_pop(L, 1);
  luaL_newlib(L, funcs);
  return 1;
}

int OpenReModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"match", Guarded<ReMatch>},
    {"search", Guarded<ReSearch>},
    {"findall", Guarded<ReFindall>},
    {"sub", Guarded<ReSub>},
    {"split", Guarded<ReSplit>},
    {nullptr, nullptr},
  };
  luaL_newlib(L, funcs);
  return 1;
}

int OpenJsonModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"encode", Guarded<JsonEncode>},
    {"decode", Guarded<JsonDecode>},
    {nullptr, nullptr},
  };
  luaL_newlib(L, funcs);
  lua_pushlightuserdata(L, JsonNull());
  lua_setfield(L, -2, "null");
  return 1;
}

int OpenTextwrapModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"wrap", Guarded<TextwrapWrap>},
    {"fill", Guarded<TextwrapFill>},
    {"dedent", Guarded<TextwrapDedent>},
    {"indent", Guarded<TextwrapIndent>},
    {"shorten", Guarded<TextwrapShorten>},
    {nullptr, nullptr},
  };
  luaL_newlib(L, funcs);
  return 1;
}

int OpenBase64Module(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"encode", Guarded<Base64Encode>},
    {"decode", Guarded<Base64Decode>},
    {nullptr, nullptr},
  };
  luaL_newlib(L, funcs);
  return 1;
}

int OpenBufferModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"new", Guarded<BufferNew>},
    {nullptr, nullptr},
  };
  static const luaL_Reg methods[] = {
    {"write", Guarded<BufferWrite>},
    {"read", Guarded<BufferRead>},
    {"seek", Guarded<BufferSeek>},
    {"tell", Guarded<BufferTell>},
    {"getvalue", Guarded<BufferGetvalue>},
    {"len", Guarded<BufferLen>},
    {nullptr, nullptr},
  };
  RegisterClass(L, kBufferMetatable, methods, DestroyObject<Buffer>);
  luaL_newlib(L, funcs);
  return 1;
}

int OpenPathModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"basename", Guarded<PathBasenameLua>},
    {"dirname", Guarded<PathDirnameLua>},
    {"join", Guarded<PathJoin>},
    {"splitext", Guarded<PathSplitext>},
    {"normpath", Guarded<PathNormpathLua>},
    {"isabs", Guarded<PathIsabs>},
    {nullptr, nullptr},
  };
  lua_createtable(L, 0, 1);
  luaL_newlib(L, funcs);
  lua_pushliteral(L, "/");
  lua_setfield(L, -2, "sep");
  lua_setfield(L, -2, "path");
  return 1;
}
