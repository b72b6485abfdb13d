#include "pdf.h"

#include <cmath>
#include <stdexcept>

#include <zlib.h>
#include <fmt/core.h>

namespace {

constexpr size_t kMaxPdfBytes = 64 << 20;
constexpr size_t kMaxPages = 10000;
// Bezier control distance for a quarter circle
constexpr double kKappa = 0.5522847498;

// advance widths of ASCII 32..126 in 1/1000 em, from the Adobe core AFM files
const short kHelveticaWidths[95] = {
  278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
  556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
  278, 278, 584, 584, 584, 556, 1015,
  667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,
  722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
  278, 278, 278, 469, 556, 333,
  556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,
  556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,
  334, 260, 334, 584,
};
const short kHelveticaBoldWidths[95] = {
  278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
  556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
  333, 333, 584, 584, 584, 611, 975,
  722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
  722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
  333, 278, 333, 584, 556, 333,
  556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
  611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
  389, 280, 389, 584,
};
// the bold and italic Times faces are measured with the roman widths
const short kTimesWidths[95] = {
  250, 333, 408, 500, 500, 833, 778, 180, 333, 333, 500, 564, 250, 333, 250, 278,
  500, 500, 500, 500, 500, 500, 500, 500, 500, 500,
  278, 278, 564, 564, 564, 444, 921,
  722, 667, 667, 722, 611, 556, 722, 722, 333, 389, 722, 611, 889,
  722, 722, 556, 722, 667, 556, 611, 722, 722, 944, 722, 722, 611,
  333, 278, 333, 469, 500, 333,
  444, 500, 444, 500, 444, 333, 500, 500, 278, 278, 500, 278, 778,
  500, 500, 500, 500, 333, 389, 278, 500, 500, 722, 500, 500, 444,
  480, 200, 480, 541,
};

// code points of WinAnsi 0x80..0x9F; 0 where undefined
const char32_t kWinAnsiHigh[32] = {
  0x20AC, 0, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
  0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0, 0x017D, 0,
  0, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
  0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0, 0x017E, 0x0178,
};

char32_t NextCodePoint(const std::string& str, size_t& pos) {
  unsigned char c = str[pos++];
  if (c < 0x80) return c;
  int extra;
  char32_t cp;
  if ((c & 0xE0) == 0xC0) {
    extra = 1, cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    extra = 2, cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    extra = 3, cp = c & 0x07;
  } else {
    return 0xFFFD;
  }
  for (int i = 0; i < extra; i++) {
    if (pos >= str.size() || ((unsigned char)str[pos] & 0xC0) != 0x80) return 0xFFFD;
    cp = cp << 6 | ((unsigned char)str[pos++] & 0x3F);
  }
  return cp;
}

char WinAnsiByte(char32_t cp) {
  if (cp == '\t') return ' ';
  if (cp >= 0x20 && cp < 0x7F) return cp;
  if (cp >= 0xA0 && cp <= 0xFF) return cp;
  for (int i = 0; i < 32; i++) {
    if (kWinAnsiHigh[i] && kWinAnsiHigh[i] == cp) return 0x80 + i;
  }
  return '?';
}

const short* WidthTable(PdfFont font) {
  switch (font) {
    case PdfFont::HELVETICA: [[fallthrough]];
    case PdfFont::HELVETICA_OBLIQUE: return kHelveticaWidths;
    case PdfFont::HELVETICA_BOLD: [[fallthrough]];
    case PdfFont::HELVETICA_BOLD_OBLIQUE: return kHelveticaBoldWidths;
    case PdfFont::TIMES_ROMAN: [[fallthrough]];
    case PdfFont::TIMES_BOLD: [[fallthrough]];
    case PdfFont::TIMES_ITALIC: [[fallthrough]];
    case PdfFont::TIMES_BOLD_ITALIC: return kTimesWidths;
    case PdfFont::COURIER: [[fallthrough]];
    case PdfFont::COURIER_BOLD: [[fallthrough]];
    case PdfFont::COURIER_OBLIQUE: [[fallthrough]];
    case PdfFont::COURIER_BOLD_OBLIQUE: return nullptr;
  }
  __builtin_unreachable();
}

double ByteWidth(const short* table, unsigned char c) {
  if (!table) return 600;
  if (c >= 32 && c <= 126) return table[c - 32];
  // accented Latin-1 letters are close to the average lowercase width
  return table['n' - 32];
}

std::string Num(double x) {
  if (!std::isfinite(x)) x = 0;
  std::string ret = fmt::format("{:.3f}", x);
  while (ret.back() == '0') ret.pop_back();
  if (ret.back() == '.') ret.pop_back();
  if (ret == "-0") ret = "0";
  return ret;
}

double Clamp01(double x) {
  if (!(x >= 0)) return 0;
  return x > 1 ? 1 : x;
}

std::string PdfString(const std::string& winansi) {
  std::string ret = "(";
  for (unsigned char c : winansi) {
    if (c == '(' || c == ')' || c == '\\') {
      ret.push_back('\\');
      ret.push_back(c);
    } else if (c < 0x20 || c >= 0x7F) {
      ret += fmt::format("\\{:03o}", c);
    } else {
      ret.push_back(c);
    }
  }
  ret.push_back(')');
  return ret;
}

std::string Compress(const std::string& data) {
  uLongf len = compressBound(data.size());
  std::string ret(len, '\0');
  if (compress2(reinterpret_cast<Bytef*>(ret.data()), &len,
                reinterpret_cast<const Bytef*>(data.data()), data.size(), Z_DEFAULT_COMPRESSION) != Z_OK) {
    throw std::runtime_error("failed to compress page content");
  }
  ret.resize(len);
  return ret;
}

std::string FontResourceName(PdfFont font) {
  return "F" + std::to_string(static_cast<int>(font) + 1);
}

} // namespace

const char* PdfFontName(PdfFont font) {
  switch (font) {
#define X(name, str) case PdfFont::name: return str;
    ENUM_PDF_FONT_
#undef X
  }
  __builtin_unreachable();
}

std::optional<PdfFont> ParsePdfFont(const std::string& str) {
#define X(name, abr) if (str == abr) return PdfFont::name;
  ENUM_PDF_FONT_
#undef X
  return std::nullopt;
}

PdfFont StyledFont(bool bold, bool italic) {
  if (bold && italic) return PdfFont::HELVETICA_BOLD_OBLIQUE;
  if (bold) return PdfFont::HELVETICA_BOLD;
  if (italic) return PdfFont::HELVETICA_OBLIQUE;
  return PdfFont::HELVETICA;
}

std::string ToWinAnsi(const std::string& utf8) {
  std::string ret;
  ret.reserve(utf8.size());
  for (size_t pos = 0; pos < utf8.size();) {
    char32_t cp = NextCodePoint(utf8, pos);
    if (cp < 0x20 && cp != '\t') continue;
    ret.push_back(WinAnsiByte(cp));
  }
  return ret;
}

double TextWidth(const std::string& utf8, PdfFont font, double size) {
  const short* table = WidthTable(font);
  double ret = 0;
  for (unsigned char c : ToWinAnsi(utf8)) ret += ByteWidth(table, c);
  return ret * size / 1000;
}

std::vector<std::string> WrapToWidth(const std::string& utf8, PdfFont font, double size, double width) {
  std::vector<std::string> ret;
  if (!(width > 0)) width = 1;
  size_t pos = 0;
  while (pos <= utf8.size()) {
    size_t end = utf8.find('\n', pos);
    if (end == std::string::npos) end = utf8.size();
    std::string para = utf8.substr(pos, end - pos);
    pos = end + 1;

    std::string line;
    size_t wpos = 0;
    bool any = false;
    while (wpos < para.size()) {
      size_t wend = para.find(' ', wpos);
      if (wend == std::string::npos) wend = para.size();
      std::string word = para.substr(wpos, wend - wpos);
      wpos = wend + 1;
      if (word.empty()) continue;
      std::string candidate = line.empty() ? word : line + " " + word;
      if (TextWidth(candidate, font, size) <= width) {
        line = std::move(candidate);
        continue;
      }
      if (line.size()) {
        ret.push_back(std::move(line));
        line.clear();
        any = true;
      }
      // the word alone may still be too wide
      while (TextWidth(word, font, size) > width) {
        size_t cut = 0, next = 0;
        while (next < word.size()) {
          size_t tmp = next;
          NextCodePoint(word, tmp);
          if (cut && TextWidth(word.substr(0, tmp), font, size) > width) break;
          cut = next = tmp;
        }
        ret.push_back(word.substr(0, cut));
        any = true;
        word.erase(0, cut);
      }
      line = std::move(word);
    }
    if (line.size() || !any) ret.push_back(std::move(line));
  }
  return ret;
}

PdfWriter::PdfWriter(double width, double height) :
    width_(width), height_(height), has_content_(false), total_bytes_(0) {
  if (!(width > 0 && height > 0 && width < 14400 && height < 14400)) {
    throw std::invalid_argument("invalid page size");
  }
  ResetState();
}

void PdfWriter::ResetState() {
  current_.clear();
  has_content_ = false;
  font_ = PdfFont::HELVETICA;
  font_size_ = 12;
}

void PdfWriter::Append(const std::string& op) {
  total_bytes_ += op.size();
  if (total_bytes_ > kMaxPdfBytes) throw std::length_error("PDF content too large");
  current_ += op;
}

void PdfWriter::SetFont(PdfFont font, double size) {
  if (!(size > 0 && size <= 1000)) throw std::invalid_argument("invalid font size");
  font_ = font;
  font_size_ = size;
}

void PdfWriter::SetFillColor(double r, double g, double b) {
  Append(Num(Clamp01(r)) + " " + Num(Clamp01(g)) + " " + Num(Clamp01(b)) + " rg\n");
}

void PdfWriter::SetStrokeColor(double r, double g, double b) {
  Append(Num(Clamp01(r)) + " " + Num(Clamp01(g)) + " " + Num(Clamp01(b)) + " RG\n");
}

void PdfWriter::SetLineWidth(double width) {
  if (!(width >= 0)) throw std::invalid_argument("invalid line width");
  Append(Num(width) + " w\n");
}

void PdfWriter::DrawText(double x, double y, const std::string& utf8) {
  used_fonts_.insert(font_);
  Append("BT /" + FontResourceName(font_) + " " + Num(font_size_) + " Tf " +
         Num(x) + " " + Num(y) + " Td " + PdfString(ToWinAnsi(utf8)) + " Tj ET\n");
  has_content_ = true;
}

void PdfWriter::Line(double x1, double y1, double x2, double y2) {
  Append(Num(x1) + " " + Num(y1) + " m " + Num(x2) + " " + Num(y2) + " l S\n");
  has_content_ = true;
}

namespace {

const char* PaintOperator(bool stroke, bool fill) {
  if (stroke && fill) return "B\n";
  if (fill) return "f\n";
  if (stroke) return "S\n";
  return "n\n";
}

} // namespace

void PdfWriter::Rect(double x, double y, double w, double h, bool stroke, bool fill) {
  Append(Num(x) + " " + Num(y) + " " + Num(w) + " " + Num(h) + " re " + PaintOperator(stroke, fill));
  has_content_ = true;
}

void PdfWriter::Circle(double x, double y, double r, bool stroke, bool fill) {
  double k = r * kKappa;
  std::string op = Num(x + r) + " " + Num(y) + " m\n";
  op += Num(x + r) + " " + Num(y + k) + " " + Num(x + k) + " " + Num(y + r) + " " + Num(x) + " " + Num(y + r) + " c\n";
  op += Num(x - k) + " " + Num(y + r) + " " + Num(x - r) + " " + Num(y + k) + " " + Num(x - r) + " " + Num(y) + " c\n";
  op += Num(x - r) + " " + Num(y - k) + " " + Num(x - k) + " " + Num(y - r) + " " + Num(x) + " " + Num(y - r) + " c\n";
  op += Num(x + k) + " " + Num(y - r) + " " + Num(x + r) + " " + Num(y - k) + " " + Num(x + r) + " " + Num(y) + " c\n";
  op += PaintOperator(stroke, fill);
  Append(op);
  has_content_ = true;
}

void PdfWriter::ShowPage() {
  if (pages_.size() >= kMaxPages) throw std::length_error("too many pages");
  pages_.push_back(std::move(current_));
  ResetState();
}

std::string PdfWriter::Finish() {
  if (has_content_ || pages_.empty()) ShowPage();

  std::vector<PdfFont> fonts(used_fonts_.begin(), used_fonts_.end());
  const size_t first_font = 4;
  const size_t first_page = first_font + fonts.size();
  const size_t num_objects = first_page + 2 * pages_.size();

  std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
  std::vector<size_t> offsets(num_objects, 0);
  auto begin_object = [&](size_t id) {
    offsets[id] = out.size();
    out += std::to_string(id) + " 0 obj\n";
  };

  begin_object(1);
  out += "<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

  begin_object(2);
  out += "<< /Type /Pages /Kids [";
  for (size_t i = 0; i < pages_.size(); i++) {
    if (i) out += ' ';
    out += std::to_string(first_page + 2 * i) + " 0 R";
  }
  out += "] /Count " + std::to_string(pages_.size()) + " >>\nendobj\n";

  begin_object(3);
  out += "<< /Producer (docbox) >>\nendobj\n";

  std::string resources = "<< /Font << ";
  for (size_t i = 0; i < fonts.size(); i++) {
    begin_object(first_font + i);
    out += std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") + PdfFontName(fonts[i]) +
           " /Encoding /WinAnsiEncoding >>\nendobj\n";
    resources += "/" + FontResourceName(fonts[i]) + " " + std::to_string(first_font + i) + " 0 R ";
  }
  resources += ">> >>";

  for (size_t i = 0; i < pages_.size(); i++) {
    size_t page_id = first_page + 2 * i;
    begin_object(page_id);
    out += "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + Num(width_) + " " + Num(height_) +
           "] /Resources " + resources + " /Contents " + std::to_string(page_id + 1) + " 0 R >>\nendobj\n";
    std::string stream = Compress(pages_[i]);
    begin_object(page_id + 1);
    out += "<< /Length " + std::to_string(stream.size()) + " /Filter /FlateDecode >>\nstream\n";
    out += stream;
    out += "\nendstream\nendobj\n";
  }

  size_t xref = out.size();
  out += "xref\n0 " + std::to_string(num_objects) + "\n";
  out += "0000000000 65535 f \n";
  for (size_t i = 1; i < num_objects; i++) out += fmt::format("{:010d} 00000 n \n", offsets[i]);
  out += "trailer\n<< /Size " + std::to_string(num_objects) + " /Root 1 0 R /Info 3 0 R >>\n";
  out += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
  return out;
}
