#ifndef DOCBOX_PDF_H_
#define DOCBOX_PDF_H_

#include <set>
#include <string>
#include <vector>
#include <optional>

// The standard Type 1 fonts every PDF reader carries
#define ENUM_PDF_FONT_ \
  X(HELVETICA, "Helvetica") \
  X(HELVETICA_BOLD, "Helvetica-Bold") \
  X(HELVETICA_OBLIQUE, "Helvetica-Oblique") \
  X(HELVETICA_BOLD_OBLIQUE, "Helvetica-BoldOblique") \
  X(TIMES_ROMAN, "Times-Roman") \
  X(TIMES_BOLD, "Times-Bold") \
  X(TIMES_ITALIC, "Times-Italic") \
  X(TIMES_BOLD_ITALIC, "Times-BoldItalic") \
  X(COURIER, "Courier") \
  X(COURIER_BOLD, "Courier-Bold") \
  X(COURIER_OBLIQUE, "Courier-Oblique") \
  X(COURIER_BOLD_OBLIQUE, "Courier-BoldOblique")
enum class PdfFont {
#define X(name, str) name,
  ENUM_PDF_FONT_
#undef X
};

const char* PdfFontName(PdfFont);
std::optional<PdfFont> ParsePdfFont(const std::string&);
PdfFont StyledFont(bool bold, bool italic);

// Text is drawn in WinAnsiEncoding; characters outside it become '?'
std::string ToWinAnsi(const std::string& utf8);
// width in points of UTF-8 text
double TextWidth(const std::string& utf8, PdfFont font, double size);
// Greedy word wrap to a width in points; '\n' forces a break. Words wider
// than the line are split by character.
std::vector<std::string> WrapToWidth(const std::string& utf8, PdfFont font, double size, double width);

constexpr double kA4Width = 595.2756;
constexpr double kA4Height = 841.8898;
constexpr double kLetterWidth = 612;
constexpr double kLetterHeight = 792;

// A PDF 1.4 writer with a drawing model close to a page canvas: origin at the
// bottom-left, coordinates in points, state reset on every new page.
class PdfWriter {
 public:
  PdfWriter(double width, double height);

  void SetFont(PdfFont font, double size);
  void SetFillColor(double r, double g, double b);
  void SetStrokeColor(double r, double g, double b);
  void SetLineWidth(double width);
  void DrawText(double x, double y, const std::string& utf8);
  void Line(double x1, double y1, double x2, double y2);
  void Rect(double x, double y, double w, double h, bool stroke, bool fill);
  void Circle(double x, double y, double r, bool stroke, bool fill);
  // ends the current page, even if it is empty
  void ShowPage();
  // Ends the current page if anything was drawn on it (or if there is no
  // page at all) and serializes the document. Throws std::runtime_error.
  std::string Finish();

  PdfFont font() const { return font_; }
  double font_size() const { return font_size_; }
  double width() const { return width_; }
  double height() const { return height_; }
  size_t page_count() const { return pages_.size(); }

 private:
  void ResetState();
  void Append(const std::string& op);

  double width_, height_;
  std::vector<std::string> pages_;
  std::string current_;
  bool has_content_;
  PdfFont font_;
  double font_size_;
  std::set<PdfFont> used_fonts_;
  size_t total_bytes_;
};

#endif  // DOCBOX_PDF_H_
