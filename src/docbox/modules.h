#ifndef DOCBOX_MODULES_H_
#define DOCBOX_MODULES_H_

struct lua_State;

// Each opener pushes one module table and registers the metatables it needs.

// prelude.cpp
int OpenRandomModule(lua_State* L);
int OpenDatetimeModule(lua_State* L);
int OpenReModule(lua_State* L);
int OpenJsonModule(lua_State* L);
int OpenTextwrapModule(lua_State* L);
int OpenBase64Module(lua_State* L);
int OpenBufferModule(lua_State* L);
// the synthesized os: a table holding only path
int OpenPathModule(lua_State* L);

// capabilities.cpp; save destinations go through the runtime's confiners
int OpenDocxModule(lua_State* L);
int OpenPptxModule(lua_State* L);
int OpenCanvasModule(lua_State* L);

#endif  // DOCBOX_MODULES_H_
