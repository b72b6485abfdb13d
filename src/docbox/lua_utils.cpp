#include "lua_utils.h"

#include <cstring>

#include "runtime.h"

const char kErrorMetatable[] = "docbox.error";

Runtime* GetRuntime(lua_State* L) {
  return *static_cast<Runtime**>(lua_getextraspace(L));
}

int RaiseScriptError(lua_State* L, DiagnosticKind kind, const char* msg) {
  lua_createtable(L, 0, 2);
  lua_pushinteger(L, static_cast<lua_Integer>(kind));
  lua_setfield(L, -2, "kind");
  luaL_where(L, 1);
  lua_pushstring(L, msg);
  lua_concat(L, 2);
  if (kind == DiagnosticKind::IMPORT || kind == DiagnosticKind::POLICY ||
      kind == DiagnosticKind::INTERRUPTED) {
    // sticky even if the script catches the error
    if (Runtime* runtime = GetRuntime(L)) runtime->RecordViolation(kind, lua_tostring(L, -1));
  }
  lua_setfield(L, -2, "message");
  luaL_setmetatable(L, kErrorMetatable);
  return lua_error(L);
}

namespace {

[[noreturn]] void BadArgument(int idx, const char* fname, const char* expected, lua_State* L) {
  throw ScriptError(DiagnosticKind::RUNTIME,
      std::string("bad argument #") + std::to_string(idx) + " to '" + fname + "' (" +
      expected + " expected, got " + luaL_typename(L, idx) + ")");
}

} // namespace

std::string ArgString(lua_State* L, int idx, const char* fname) {
  int type = lua_type(L, idx);
  if (type != LUA_TSTRING && type != LUA_TNUMBER) BadArgument(idx, fname, "string", L);
  size_t len;
  const char* str = lua_tolstring(L, idx, &len);
  return std::string(str, len);
}

std::optional<std::string> OptString(lua_State* L, int idx, const char* fname) {
  if (lua_isnoneornil(L, idx)) return std::nullopt;
  return ArgString(L, idx, fname);
}

double ArgNumber(lua_State* L, int idx, const char* fname) {
  int isnum;
  double ret = lua_tonumberx(L, idx, &isnum);
  if (!isnum) BadArgument(idx, fname, "number", L);
  return ret;
}

double OptNumber(lua_State* L, int idx, const char* fname, double def) {
  if (lua_isnoneornil(L, idx)) return def;
  return ArgNumber(L, idx, fname);
}

lua_Integer ArgInteger(lua_State* L, int idx, const char* fname) {
  int isnum;
  lua_Integer ret = lua_tointegerx(L, idx, &isnum);
  if (!isnum) BadArgument(idx, fname, "integer", L);
  return ret;
}

lua_Integer OptInteger(lua_State* L, int idx, const char* fname, lua_Integer def) {
  if (lua_isnoneornil(L, idx)) return def;
  return ArgInteger(L, idx, fname);
}

bool OptBoolean(lua_State* L, int idx, bool def) {
  if (lua_isnoneornil(L, idx)) return def;
  return lua_toboolean(L, idx);
}

void ArgTable(lua_State* L, int idx, const char* fname) {
  if (!lua_istable(L, idx)) BadArgument(idx, fname, "table", L);
}

std::optional<std::string> FieldString(lua_State* L, int idx, const char* key) {
  idx = lua_absindex(L, idx);
  lua_pushstring(L, key);
  int type = lua_rawget(L, idx);
  std::optional<std::string> ret;
  if (type == LUA_TSTRING || type == LUA_TNUMBER) {
    size_t len;
    const char* str = lua_tolstring(L, -1, &len);
    ret.emplace(str, len);
  } else if (type != LUA_TNIL) {
    lua_pop(L, 1);
    throw ScriptError(DiagnosticKind::RUNTIME, std::string("field '") + key + "' must be a string");
  }
  lua_pop(L, 1);
  return ret;
}

double FieldNumber(lua_State* L, int idx, const char* key, double def) {
  idx = lua_absindex(L, idx);
  lua_pushstring(L, key);
  lua_rawget(L, idx);
  int isnum;
  double ret = lua_tonumberx(L, -1, &isnum);
  bool is_nil = lua_isnil(L, -1);
  lua_pop(L, 1);
  if (is_nil) return def;
  if (!isnum) throw ScriptError(DiagnosticKind::RUNTIME, std::string("field '") + key + "' must be a number");
  return ret;
}

bool FieldBoolean(lua_State* L, int idx, const char* key, bool def) {
  idx = lua_absindex(L, idx);
  lua_pushstring(L, key);
  lua_rawget(L, idx);
  bool ret = lua_isnil(L, -1) ? def : lua_toboolean(L, -1);
  lua_pop(L, 1);
  return ret;
}

std::vector<std::string> ArgStringList(lua_State* L, int idx, const char* fname) {
  ArgTable(L, idx, fname);
  idx = lua_absindex(L, idx);
  std::vector<std::string> ret;
  lua_Unsigned len = lua_rawlen(L, idx);
  for (lua_Unsigned i = 1; i <= len; i++) {
    int type = lua_rawgeti(L, idx, i);
    if (type != LUA_TSTRING && type != LUA_TNUMBER) {
      lua_pop(L, 1);
      throw ScriptError(DiagnosticKind::RUNTIME,
          std::string("bad argument #") + std::to_string(idx) + " to '" + fname +
          "' (item " + std::to_string(i) + " is not a string)");
    }
    size_t slen;
    const char* str = lua_tolstring(L, -1, &slen);
    ret.emplace_back(str, slen);
    lua_pop(L, 1);
  }
  return ret;
}

void RegisterClass(lua_State* L, const char* tname, const luaL_Reg* methods, lua_CFunction gc) {
  luaL_newmetatable(L, tname);
  lua_newtable(L);
  luaL_setfuncs(L, methods, 0);
  lua_setfield(L, -2, "__index");
  if (gc) {
    lua_pushcfunction(L, gc);
    lua_setfield(L, -2, "__gc");
  }
  lua_pushboolean(L, 0);
  lua_setfield(L, -2, "__metatable");
  lua_pop(L, 1);
}
