#include "modules.h"

#include <cmath>
#include <stdexcept>

#include "lua_utils.h"
#include "runtime.h"
#include "document.h"
#include "slides.h"
#include "pdf.h"

namespace {

const char kDocumentMetatable[] = "docbox.docx.Document";
const char kPresentationMetatable[] = "docbox.pptx.Presentation";
const char kCanvasMetatable[] = "docbox.canvas.Canvas";

// scripts only ever see the base name of what they wrote
int PushSaved(lua_State* L, const std::filesystem::path& path) {
  std::string name = path.filename().string();
  lua_pushlstring(L, name.data(), name.size());
  return 1;
}

std::string UnsupportedFormat(const std::string& cap, const std::string& ext) {
  return cap + ": cannot render format '" + ext + "'";
}

/// docx

Document* CheckDocument(lua_State* L, const char* fname) {
  return CheckObject<Document>(L, 1, kDocumentMetatable, fname);
}

int DocxNew(lua_State* L) {
  NewObject<Document>(L, kDocumentMetatable);
  return 1;
}

int DocumentAddHeading(lua_State* L) {
  Document* doc = CheckDocument(L, "add_heading");
  std::string text = ArgString(L, 2, "add_heading");
  doc->AddHeading(text, (int)OptInteger(L, 3, "add_heading", 1));
  lua_settop(L, 1);
  return 1;
}

int DocumentAddParagraph(lua_State* L) {
  Document* doc = CheckDocument(L, "add_paragraph");
  std::string text = ArgString(L, 2, "add_paragraph");
  TextStyle style;
  if (!lua_isnoneornil(L, 3)) {
    ArgTable(L, 3, "add_paragraph");
    style.bold = FieldBoolean(L, 3, "bold", false);
    style.italic = FieldBoolean(L, 3, "italic", false);
    style.size = FieldNumber(L, 3, "size", 0);
    if (style.size < 0 || style.size > 400) {
      throw std::invalid_argument("add_paragraph: size out of range");
    }
    if (auto align = FieldString(L, 3, "align")) {
      auto parsed = ParseAlignment(*align);
      if (!parsed) throw std::invalid_argument("add_paragraph: unknown alignment '" + *align + "'");
      style.align = *parsed;
    }
  }
  doc->AddParagraph(text, style);
  lua_settop(L, 1);
  return 1;
}

int DocumentAddListItem(lua_State* L) {
  Document* doc = CheckDocument(L, "add_list_item");
  doc->AddListItem(ArgString(L, 2, "add_list_item"));
  lua_settop(L, 1);
  return 1;
}

int DocumentAddTable(lua_State* L) {
  Document* doc = CheckDocument(L, "add_table");
  ArgTable(L, 2, "add_table");
  std::vector<std::vector<std::string>> rows;
  lua_Integer n = (lua_Integer)lua_rawlen(L, 2);
  for (lua_Integer i = 1; i <= n; i++) {
    lua_rawgeti(L, 2, i);
    int row = lua_gettop(L);
    if (!lua_istable(L, row)) throw std::invalid_argument("add_table: rows must be tables");
    rows.push_back(ArgStringList(L, row, "add_table"));
    lua_pop(L, 1);
  }
  doc->AddTable(std::move(rows));
  lua_settop(L, 1);
  return 1;
}

int DocumentAddPageBreak(lua_State* L) {
  CheckDocument(L, "add_page_break")->AddPageBreak();
  lua_settop(L, 1);
  return 1;
}

int DocumentSave(lua_State* L) {
  Document* doc = CheckDocument(L, "save");
  std::string name = ArgString(L, 2, "save");
  auto path = GetRuntime(L)->Confiner("docx").Save(name, [doc](const std::string& ext) {
    if (ext == ".docx") return doc->ToDocx();
    if (ext == ".pdf") return doc->ToPdf();
    throw std::invalid_argument(UnsupportedFormat("docx", ext));
  });
  return PushSaved(L, path);
}

/// pptx

Presentation* CheckPresentation(lua_State* L, const char* fname) {
  return CheckObject<Presentation>(L, 1, kPresentationMetatable, fname);
}

int PptxNew(lua_State* L) {
  NewObject<Presentation>(L, kPresentationMetatable);
  return 1;
}

int PresentationAddSlide(lua_State* L) {
  Presentation* deck = CheckPresentation(L, "add_slide");
  Slide slide;
  if (!lua_isnoneornil(L, 2)) {
    ArgTable(L, 2, "add_slide");
    slide.title = FieldString(L, 2, "title").value_or("");
    slide.body = FieldString(L, 2, "body").value_or("");
    lua_pushliteral(L, "bullets");
    if (lua_rawget(L, 2) != LUA_TNIL) {
      int idx = lua_gettop(L);
      if (!lua_istable(L, idx)) throw std::invalid_argument("add_slide: bullets must be a table");
      slide.bullets = ArgStringList(L, idx, "add_slide");
    }
    lua_pop(L, 1);
  }
  deck->AddSlide(std::move(slide));
  lua_pushinteger(L, deck->slide_count());
  return 1;
}

int PresentationSlideCount(lua_State* L) {
  lua_pushinteger(L, CheckPresentation(L, "slide_count")->slide_count());
  return 1;
}

int PresentationSave(lua_State* L) {
  Presentation* deck = CheckPresentation(L, "save");
  std::string name = ArgString(L, 2, "save");
  auto path = GetRuntime(L)->Confiner("pptx").Save(name, [deck](const std::string& ext) {
    if (ext == ".pptx") return deck->ToPptx();
    if (ext == ".pdf") return deck->ToPdf();
    throw std::invalid_argument(UnsupportedFormat("pptx", ext));
  });
  return PushSaved(L, path);
}

/// canvas

struct Canvas {
  Canvas(std::string name_, double width, double height) :
      name(std::move(name_)), pdf(width, height), saved(false) {}

  std::string name; // already confined
  PdfWriter pdf;
  bool saved;
};

Canvas* CheckCanvas(lua_State* L, const char* fname) {
  Canvas* c = CheckObject<Canvas>(L, 1, kCanvasMetatable, fname);
  if (c->saved) throw std::runtime_error(std::string(fname) + ": canvas already saved");
  return c;
}

// reportlab-style flags: numbers and booleans both accepted
bool OptFlag(lua_State* L, int idx, bool def) {
  if (lua_isnoneornil(L, idx)) return def;
  if (lua_isboolean(L, idx)) return lua_toboolean(L, idx);
  return ArgNumber(L, idx, "flag") != 0;
}

double Component(lua_State* L, int idx, const char* fname) {
  double v = ArgNumber(L, idx, fname);
  if (!(v >= 0 && v <= 1)) throw std::invalid_argument(std::string(fname) + ": color components are 0..1");
  return v;
}

double Coordinate(lua_State* L, int idx, const char* fname) {
  double v = ArgNumber(L, idx, fname);
  if (!std::isfinite(v)) throw std::invalid_argument(std::string(fname) + ": coordinates must be finite");
  return v;
}

void PushPageSize(lua_State* L, double width, double height) {
  lua_createtable(L, 2, 0);
  lua_pushnumber(L, width);
  lua_rawseti(L, -2, 1);
  lua_pushnumber(L, height);
  lua_rawseti(L, -2, 2);
}

int CanvasNew(lua_State* L) {
  std::string requested = ArgString(L, 1, "Canvas");
  double width = kA4Width, height = kA4Height;
  if (!lua_isnoneornil(L, 2)) {
    ArgTable(L, 2, "Canvas");
    lua_rawgeti(L, 2, 1);
    lua_rawgeti(L, 2, 2);
    if (!lua_isnumber(L, -2) || !lua_isnumber(L, -1)) {
      throw std::invalid_argument("Canvas: pagesize must be {width, height}");
    }
    width = lua_tonumber(L, -2);
    height = lua_tonumber(L, -1);
    lua_pop(L, 2);
    if (!(width >= 1 && width <= 14400 && height >= 1 && height <= 14400)) {
      throw std::invalid_argument("Canvas: pagesize out of range");
    }
  }
  auto target = GetRuntime(L)->Confiner("canvas").Confine(requested);
  NewObject<Canvas>(L, kCanvasMetatable, target.filename().string(), width, height);
  return 1;
}

int CanvasSetFont(lua_State* L) {
  Canvas* c = CheckCanvas(L, "setFont");
  std::string name = ArgString(L, 2, "setFont");
  double size = ArgNumber(L, 3, "setFont");
  auto font = ParsePdfFont(name);
  if (!font) throw std::invalid_argument("setFont: unknown font '" + name + "'");
  if (!(size > 0 && size <= 1000)) throw std::invalid_argument("setFont: size out of range");
  c->pdf.SetFont(*font, size);
  return 0;
}

int CanvasSetFillColorRGB(lua_State* L) {
  Canvas* c = CheckCanvas(L, "setFillColorRGB");
  c->pdf.SetFillColor(Component(L, 2, "setFillColorRGB"), Component(L, 3, "setFillColorRGB"),
                      Component(L, 4, "setFillColorRGB"));
  return 0;
}

int CanvasSetStrokeColorRGB(lua_State* L) {
  Canvas* c = CheckCanvas(L, "setStrokeColorRGB");
  c->pdf.SetStrokeColor(Component(L, 2, "setStrokeColorRGB"), Component(L, 3, "setStrokeColorRGB"),
                        Component(L, 4, "setStrokeColorRGB"));
  return 0;
}

int CanvasSetLineWidth(lua_State* L) {
  Canvas* c = CheckCanvas(L, "setLineWidth");
  double width = ArgNumber(L, 2, "setLineWidth");
  if (!(width >= 0 && width <= 1000)) throw std::invalid_argument("setLineWidth: width out of range");
  c->pdf.SetLineWidth(width);
  return 0;
}

enum class Anchor { LEFT, CENTRE, RIGHT };

template <Anchor A> int CanvasDrawString(lua_State* L) {
  const char* fname = A == Anchor::LEFT ? "drawString" :
                      A == Anchor::CENTRE ? "drawCentredString" : "drawRightString";
  Canvas* c = CheckCanvas(L, fname);
  double x = Coordinate(L, 2, fname);
  double y = Coordinate(L, 3, fname);
  std::string text = ArgString(L, 4, fname);
  double width = TextWidth(text, c->pdf.font(), c->pdf.font_size());
  if (A == Anchor::CENTRE) x -= width / 2;
  if (A == Anchor::RIGHT) x -= width;
  c->pdf.DrawText(x, y, text);
  return 0;
}

int CanvasLine(lua_State* L) {
  Canvas* c = CheckCanvas(L, "line");
  c->pdf.Line(Coordinate(L, 2, "line"), Coordinate(L, 3, "line"),
              Coordinate(L, 4, "line"), Coordinate(L, 5, "line"));
  return 0;
}

int CanvasRect(lua_State* L) {
  Canvas* c = CheckCanvas(L, "rect");
  double x = Coordinate(L, 2, "rect"), y = Coordinate(L, 3, "rect");
  double w = Coordinate(L, 4, "rect"), h = Coordinate(L, 5, "rect");
  c->pdf.Rect(x, y, w, h, OptFlag(L, 6, true), OptFlag(L, 7, false));
  return 0;
}

int CanvasCircle(lua_State* L) {
  Canvas* c = CheckCanvas(L, "circle");
  double x = Coordinate(L, 2, "circle"), y = Coordinate(L, 3, "circle");
  double r = Coordinate(L, 4, "circle");
  if (r < 0) throw std::invalid_argument("circle: negative radius");
  c->pdf.Circle(x, y, r, OptFlag(L, 5, true), OptFlag(L, 6, false));
  return 0;
}

int CanvasShowPage(lua_State* L) {
  CheckCanvas(L, "showPage")->pdf.ShowPage();
  return 0;
}

int CanvasStringWidth(lua_State* L) {
  Canvas* c = CheckCanvas(L, "stringWidth");
  std::string text = ArgString(L, 2, "stringWidth");
  PdfFont font = c->pdf.font();
  if (auto name = OptString(L, 3, "stringWidth")) {
    auto parsed = ParsePdfFont(*name);
    if (!parsed) throw std::invalid_argument("stringWidth: unknown font '" + *name + "'");
    font = *parsed;
  }
  double size = OptNumber(L, 4, "stringWidth", c->pdf.font_size());
  lua_pushnumber(L, TextWidth(text, font, size));
  return 1;
}

int CanvasSave(lua_State* L) {
  Canvas* c = CheckCanvas(L, "save");
  auto path = GetRuntime(L)->Confiner("canvas").Save(c->name, [c](const std::string& ext) {
    if (ext != ".pdf") throw std::invalid_argument(UnsupportedFormat("canvas", ext));
    return c->pdf.Finish();
  });
  c->saved = true;
  return PushSaved(L, path);
}

} // namespace

int OpenDocxModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"Document", Guarded<DocxNew>},
    {nullptr, nullptr},
  };
  static const luaL_Reg methods[] = {
    {"add_heading", Guarded<DocumentAddHeading>},
    {"add_paragraph", Guarded<DocumentAddParagraph>},
    {"add_list_item", Guarded<DocumentAddListItem>},
    {"add_table", Guarded<DocumentAddTable>},
    {"add_page_break", Guarded<DocumentAddPageBreak>},
    {"save", Guarded<DocumentSave>},
    {nullptr, nullptr},
  };
  RegisterClass(L, kDocumentMetatable, methods, DestroyObject<Document>);
  luaL_newlib(L, funcs);
  return 1;
}

int OpenPptxModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"Presentation", Guarded<PptxNew>},
    {nullptr, nullptr},
  };
  static const luaL_Reg methods[] = {
    {"add_slide", Guarded<PresentationAddSlide>},
    {"slide_count", Guarded<PresentationSlideCount>},
    {"save", Guarded<PresentationSave>},
    {nullptr, nullptr},
  };
  RegisterClass(L, kPresentationMetatable, methods, DestroyObject<Presentation>);
  luaL_newlib(L, funcs);
  return 1;
}

int OpenCanvasModule(lua_State* L) {
  static const luaL_Reg funcs[] = {
    {"Canvas", Guarded<CanvasNew>},
    {nullptr, nullptr},
  };
  static const luaL_Reg methods[] = {
    {"setFont", Guarded<CanvasSetFont>},
    {"setFillColorRGB", Guarded<CanvasSetFillColorRGB>},
    {"setStrokeColorRGB", Guarded<CanvasSetStrokeColorRGB>},
    {"setLineWidth", Guarded<CanvasSetLineWidth>},
    {"drawString", Guarded<CanvasDrawString<Anchor::LEFT>>},
    {"drawCentredString", Guarded<CanvasDrawString<Anchor::CENTRE>>},
    {"drawRightString", Guarded<CanvasDrawString<Anchor::RIGHT>>},
    {"line", Guarded<CanvasLine>},
    {"rect", Guarded<CanvasRect>},
    {"circle", Guarded<CanvasCircle>},
    {"showPage", Guarded<CanvasShowPage>},
    {"stringWidth", Guarded<CanvasStringWidth>},
    {"save", Guarded<CanvasSave>},
    {nullptr, nullptr},
  };
  RegisterClass(L, kCanvasMetatable, methods, DestroyObject<Canvas>);
  luaL_newlib(L, funcs);
  PushPageSize(L, kA4Width, kA4Height);
  lua_setfield(L, -2, "A4");
  PushPageSize(L, kLetterWidth, kLetterHeight);
  lua_setfield(L, -2, "letter");
  return 1;
}
