#include "runtime.h"

#include <cstdlib>
#include <cstring>
#include <string_view>

#include <spdlog/spdlog.h>
#include <docbox/utils.h>

#include "lua_utils.h"
#include "modules.h"

namespace {

// registry key of the table require() resolves names against
const char kModulesKey[] = "docbox.modules";
constexpr int kHookInstructions = 10000;
constexpr size_t kMaxConsoleBytes = 64 << 10;

struct ModuleEntry {
  const char* name;
  lua_CFunction open;
  bool global; // pre-populated in the script namespace
};

const ModuleEntry kModules[] = {
  {"string", luaopen_string, true},
  {"table", luaopen_table, true},
  {"math", luaopen_math, true},
  {"utf8", luaopen_utf8, true},
  {"random", OpenRandomModule, true},
  {"datetime", OpenDatetimeModule, true},
  {"re", OpenReModule, true},
  {"json", OpenJsonModule, true},
  {"textwrap", OpenTextwrapModule, true},
  {"base64", OpenBase64Module, true},
  {"buffer", OpenBufferModule, true},
  {kPathCapability, OpenPathModule, false},
  {"docx", OpenDocxModule, false},
  {"pptx", OpenPptxModule, false},
  {"canvas", OpenCanvasModule, false},
};

const char* const kOutputCapabilities[] = {"docx", "pptx", "canvas"};

// base functions that reach the file system, the compiler or the host
const char* const kRemovedGlobals[] = {"dofile", "loadfile", "load", "warn"};

DiagnosticKind ToDiagnosticKind(lua_Integer kind) {
  if (kind < 0 || kind > static_cast<lua_Integer>(DiagnosticKind::TIMEOUT)) {
    return DiagnosticKind::RUNTIME;
  }
  return static_cast<DiagnosticKind>(kind);
}

int ErrorToString(lua_State* L) {
  lua_getfield(L, 1, "kind");
  DiagnosticKind kind = ToDiagnosticKind(lua_tointeger(L, -1));
  lua_getfield(L, 1, "message");
  lua_pushfstring(L, "%s: %s", DiagnosticKindName(kind), lua_tostring(L, -1));
  return 1;
}

int ImportGateImpl(lua_State* L) {
  std::string name = ArgString(L, 1, "require");
  Runtime* runtime = GetRuntime(L);
  if (!runtime->policy().IsImportAllowed(name)) {
    spdlog::info("Denied import of {}", name);
    throw ImportDenied(name);
  }
  lua_getfield(L, LUA_REGISTRYINDEX, kModulesKey);
  for (size_t pos = 0; pos <= name.size();) {
    size_t end = name.find('.', pos);
    if (end == std::string::npos) end = name.size();
    if (!lua_istable(L, -1) || end == pos) {
      throw ScriptError(DiagnosticKind::RUNTIME, "module '" + name + "' not found");
    }
    lua_pushlstring(L, name.data() + pos, end - pos);
    lua_rawget(L, -2);
    lua_remove(L, -2);
    pos = end + 1;
  }
  if (lua_isnil(L, -1)) {
    throw ScriptError(DiagnosticKind::RUNTIME, "module '" + name + "' not found");
  }
  return 1;
}

int PrintImpl(lua_State* L) {
  int n = lua_gettop(L);
  luaL_Buffer buf;
  luaL_buffinit(L, &buf);
  for (int i = 1; i <= n; i++) {
    if (i > 1) luaL_addchar(&buf, '\t');
    luaL_tolstring(L, i, nullptr);
    luaL_addvalue(&buf);
  }
  luaL_pushresult(&buf);
  size_t len;
  const char* str = lua_tolstring(L, -1, &len);
  GetRuntime(L)->Console(str, len);
  return 0;
}

int CollectGarbage(lua_State* L) {
  const char* opt = luaL_optstring(L, 1, "collect");
  if (!strcmp(opt, "collect")) {
    lua_gc(L, LUA_GCCOLLECT);
    lua_pushinteger(L, 0);
    return 1;
  }
  if (!strcmp(opt, "count")) {
    int kb = lua_gc(L, LUA_GCCOUNT);
    int bytes = lua_gc(L, LUA_GCCOUNTB);
    lua_pushnumber(L, kb + bytes / 1024.0);
    return 1;
  }
  return luaL_argerror(L, 1, lua_pushfstring(L, "option '%s' is not allowed", opt));
}

void InterruptHook(lua_State* L, lua_Debug*) {
  Runtime* runtime = GetRuntime(L);
  if (runtime && runtime->interrupted()) {
    RaiseScriptError(L, DiagnosticKind::INTERRUPTED, "execution interrupted by the host");
  }
}

bool IsErrorObject(lua_State* L, int idx) {
  if (!lua_istable(L, idx) || !lua_getmetatable(L, idx)) return false;
  luaL_getmetatable(L, kErrorMetatable);
  bool ret = lua_rawequal(L, -1, -2);
  lua_pop(L, 2);
  return ret;
}

// Replaces the error value by {kind=, message=, trace=}
int MessageHandler(lua_State* L) {
  lua_Integer kind = static_cast<lua_Integer>(DiagnosticKind::RUNTIME);
  if (IsErrorObject(L, 1)) {
    lua_getfield(L, 1, "kind");
    kind = lua_tointeger(L, -1);
    lua_getfield(L, 1, "message");
  } else if (lua_type(L, 1) == LUA_TSTRING || lua_type(L, 1) == LUA_TNUMBER) {
    lua_pushvalue(L, 1);
    lua_tostring(L, -1);
  } else if (luaL_getmetafield(L, 1, "__tostring") != LUA_TNIL) {
    lua_pop(L, 1);
    luaL_tolstring(L, 1, nullptr);
  } else {
    lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
  }
  int msg = lua_gettop(L);
  lua_createtable(L, 0, 3);
  lua_pushinteger(L, kind);
  lua_setfield(L, -2, "kind");
  lua_pushvalue(L, msg);
  lua_setfield(L, -2, "message");
  luaL_traceback(L, L, nullptr, 1);
  lua_setfield(L, -2, "trace");
  return 1;
}

int OpenEnvironmentImpl(lua_State* L) {
  const Policy& policy = GetRuntime(L)->policy();

  luaL_newmetatable(L, kErrorMetatable);
  lua_pushcfunction(L, ErrorToString);
  lua_setfield(L, -2, "__tostring");
  lua_pushboolean(L, 0);
  lua_setfield(L, -2, "__metatable");
  lua_pop(L, 1);

  luaL_requiref(L, LUA_GNAME, luaopen_base, 1);
  lua_pop(L, 1);
  for (auto name : kRemovedGlobals) {
    lua_pushnil(L);
    lua_setglobal(L, name);
  }
  lua_register(L, "print", Guarded<PrintImpl>);
  lua_register(L, "collectgarbage", CollectGarbage);
  lua_register(L, "require", Guarded<ImportGateImpl>);

  // the string metatable is needed even when the module is not allow-listed
  luaL_requiref(L, LUA_STRLIBNAME, luaopen_string, 0);
  lua_pushnil(L);
  lua_setfield(L, -2, "dump");
  lua_pop(L, 1);

  lua_newtable(L);
  for (auto& i : kModules) {
    if (!policy.IsImportAllowed(i.name)) continue;
    luaL_requiref(L, i.name, i.open, 0);
    if (i.global) {
      lua_pushvalue(L, -1);
      lua_setglobal(L, i.name);
    }
    lua_setfield(L, -2, i.name);
  }
  lua_setfield(L, LUA_REGISTRYINDEX, kModulesKey);
  return 0;
}

// "\tscript:3: in main chunk" lines only
std::string ScriptTrace(const std::string& traceback) {
  std::string ret;
  size_t pos = 0;
  while (pos < traceback.size()) {
    size_t end = traceback.find('\n', pos);
    if (end == std::string::npos) end = traceback.size();
    std::string_view line(traceback.data() + pos, end - pos);
    while (line.size() && line[0] == '\t') line.remove_prefix(1);
    if (line.substr(0, 7) == "script:") {
      if (ret.size()) ret += '\n';
      ret += line;
    }
    pos = end + 1;
  }
  return ret;
}

std::string StringField(lua_State* L, int idx, const char* key) {
  lua_getfield(L, idx, key);
  size_t len = 0;
  const char* str = lua_tolstring(L, -1, &len);
  std::string ret = str ? std::string(str, len) : std::string();
  lua_pop(L, 1);
  return ret;
}

} // namespace

Runtime::Runtime(const Policy& policy, std::filesystem::path job_dir, size_t memory_limit,
                 const volatile sig_atomic_t* interrupt) :
    policy_(policy), job_dir_(std::move(job_dir)), memory_limit_(memory_limit),
    memory_used_(0), interrupt_(interrupt), L_(nullptr), prepared_(false),
    console_bytes_(0) {
  L_ = lua_newstate(Allocate, this);
  if (L_) *static_cast<Runtime**>(lua_getextraspace(L_)) = this;
}

Runtime::~Runtime() {
  if (L_) lua_close(L_);
}

void* Runtime::Allocate(void* ud, void* ptr, size_t osize, size_t nsize) {
  auto self = static_cast<Runtime*>(ud);
  // osize is a type tag when ptr is null
  if (!ptr) osize = 0;
  if (nsize == 0) {
    free(ptr);
    self->memory_used_ -= osize;
    return nullptr;
  }
  if (self->memory_limit_ && nsize > osize &&
      self->memory_used_ + (nsize - osize) > self->memory_limit_) {
    return nullptr;
  }
  void* ret = realloc(ptr, nsize);
  if (ret) self->memory_used_ = self->memory_used_ - osize + nsize;
  return ret;
}

std::optional<ScriptFailure> Runtime::Prepare() {
  if (prepared_) return setup_failure_;
  prepared_ = true;
  if (!L_) {
    setup_failure_ = ScriptFailure{DiagnosticKind::SETUP, "cannot create interpreter", ""};
    return setup_failure_;
  }
  for (auto cap : kOutputCapabilities) {
    confiners_.emplace(cap, OutputConfiner(policy_, cap, job_dir_));
  }
  lua_pushcfunction(L_, Guarded<OpenEnvironmentImpl>);
  int status = lua_pcall(L_, 0, 0, 0);
  if (status != LUA_OK) {
    std::string msg = status == LUA_ERRMEM ? "not enough memory" : StringField(L_, -1, "message");
    if (msg.empty() && lua_isstring(L_, -1)) msg = lua_tostring(L_, -1);
    lua_settop(L_, 0);
    spdlog::error("Failed to prepare interpreter: {}", msg);
    setup_failure_ = ScriptFailure{DiagnosticKind::SETUP, msg, ""};
    return setup_failure_;
  }
  spdlog::debug("Interpreter prepared, {} bytes in use", memory_used_);
  return std::nullopt;
}

std::optional<ScriptFailure> Runtime::Execute(const std::string& source) {
  if (auto failure = Prepare()) return failure;
  lua_settop(L_, 0);
  lua_pushcfunction(L_, MessageHandler);
  int status = luaL_loadbufferx(L_, source.data(), source.size(), "=script", "t");
  if (status != LUA_OK) {
    ScriptFailure ret;
    if (status == LUA_ERRSYNTAX) {
      ret = {DiagnosticKind::SYNTAX, lua_tostring(L_, -1), ""};
    } else {
      ret = {DiagnosticKind::MEMORY, "not enough memory", ""};
    }
    lua_settop(L_, 0);
    return ret;
  }
  lua_sethook(L_, InterruptHook, LUA_MASKCOUNT, kHookInstructions);
  status = lua_pcall(L_, 0, 0, 1);
  lua_sethook(L_, nullptr, 0, 0);

  std::optional<ScriptFailure> failure;
  switch (status) {
    case LUA_OK: break;
    case LUA_ERRRUN: {
      lua_getfield(L_, -1, "kind");
      DiagnosticKind kind = ToDiagnosticKind(lua_tointeger(L_, -1));
      lua_pop(L_, 1);
      failure = ScriptFailure{kind, StringField(L_, -1, "message"),
                              ScriptTrace(StringField(L_, -1, "trace"))};
      break;
    }
    case LUA_ERRMEM:
      failure = ScriptFailure{DiagnosticKind::MEMORY, "not enough memory", ""};
      break;
    default:
      failure = ScriptFailure{DiagnosticKind::RUNTIME, "error while handling an error", ""};
  }
  lua_settop(L_, 0);
  spdlog::debug("Script finished with status {}, {} bytes in use", status, memory_used_);
  // a caught import or policy violation still fails the run
  if (violation_) return violation_;
  return failure;
}

void Runtime::RecordViolation(DiagnosticKind kind, const char* message) noexcept {
  spdlog::info("Recorded {}: {}", DiagnosticKindName(kind), message);
  if (!violation_) violation_ = ScriptFailure{kind, message, ""};
}

const OutputConfiner& Runtime::Confiner(const std::string& capability) const {
  auto it = confiners_.find(capability);
  if (it == confiners_.end()) throw PolicyViolation(capability + " cannot write files");
  return it->second;
}

void Runtime::Console(const char* str, size_t len) {
  if (console_bytes_ >= kMaxConsoleBytes) return;
  bool cut = false;
  if (len > kMaxConsoleBytes - console_bytes_) {
    len = kMaxConsoleBytes - console_bytes_;
    cut = true;
  }
  console_bytes_ += len;
  spdlog::info("script: {}", std::string_view(str, len));
  if (cut) spdlog::warn("Console output limit reached; further output dropped");
}
