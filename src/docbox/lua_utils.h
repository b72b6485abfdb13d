#ifndef DOCBOX_LUA_UTILS_H_
#define DOCBOX_LUA_UTILS_H_

#include <new>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <exception>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

#include "script_error.h"

class Runtime;

// metatable of error objects raised by native code
extern const char kErrorMetatable[];

Runtime* GetRuntime(lua_State* L);

// Pushes {kind=, message=} and raises it; records policy violations on the
// runtime first. Never returns.
int RaiseScriptError(lua_State* L, DiagnosticKind kind, const char* msg);

// Native functions never let a C++ exception reach Lua and never longjmp
// over live C++ objects: argument helpers below throw instead of calling
// luaL_error, and Guarded<> converts the exception once the frame is gone.
template <int (*F)(lua_State*)> int Guarded(lua_State* L) {
  DiagnosticKind kind;
  char msg[1024];
  auto copy = [&msg](const char* what) {
    size_t i = 0;
    for (; what[i] && i + 1 < sizeof(msg); i++) msg[i] = what[i];
    msg[i] = '\0';
  };
  try {
    return F(L);
  } catch (ScriptError& e) {
    kind = e.kind();
    copy(e.what());
  } catch (std::bad_alloc&) {
    kind = DiagnosticKind::MEMORY;
    copy("not enough memory");
  } catch (std::exception& e) {
    kind = DiagnosticKind::RUNTIME;
    copy(e.what());
  }
  return RaiseScriptError(L, kind, msg);
}

/// Argument access; fname names the function in error messages
std::string ArgString(lua_State* L, int idx, const char* fname);
std::optional<std::string> OptString(lua_State* L, int idx, const char* fname);
double ArgNumber(lua_State* L, int idx, const char* fname);
double OptNumber(lua_State* L, int idx, const char* fname, double def);
lua_Integer ArgInteger(lua_State* L, int idx, const char* fname);
lua_Integer OptInteger(lua_State* L, int idx, const char* fname, lua_Integer def);
bool OptBoolean(lua_State* L, int idx, bool def);
void ArgTable(lua_State* L, int idx, const char* fname);
// raw field access on the table at idx; missing fields give nullopt / def
std::optional<std::string> FieldString(lua_State* L, int idx, const char* key);
double FieldNumber(lua_State* L, int idx, const char* key, double def);
bool FieldBoolean(lua_State* L, int idx, const char* key, bool def);
// strings of a sequence (numbers are converted); other values throw
std::vector<std::string> ArgStringList(lua_State* L, int idx, const char* fname);

/// Userdata holding a C++ object

// Creates the metatable tname with the given methods as __index, a __gc
// destroying the object, and a locked __metatable. Leaves nothing on the stack.
void RegisterClass(lua_State* L, const char* tname, const luaL_Reg* methods, lua_CFunction gc);

template <class T> int DestroyObject(lua_State* L) {
  // testudata fails once the metatable is cleared, so a resurrected
  // object is never destroyed twice
  if (auto ptr = static_cast<T*>(lua_touserdata(L, 1)); ptr && lua_getmetatable(L, 1)) {
    lua_pop(L, 1);
    ptr->~T();
    lua_pushnil(L);
    lua_setmetatable(L, 1);
  }
  return 0;
}

template <class T, class... Args> T* NewObject(lua_State* L, const char* tname, Args&&... args) {
  void* mem = lua_newuserdatauv(L, sizeof(T), 0);
  T* ret = new (mem) T(std::forward<Args>(args)...);
  luaL_setmetatable(L, tname);
  return ret;
}

template <class T> T* CheckObject(lua_State* L, int idx, const char* tname, const char* fname) {
  if (auto ptr = static_cast<T*>(luaL_testudata(L, idx, tname))) return ptr;
  throw ScriptError(DiagnosticKind::RUNTIME,
      std::string("bad argument #") + std::to_string(idx) + " to '" + fname +
      "' (" + tname + " expected)");
}

#endif  // DOCBOX_LUA_UTILS_H_
