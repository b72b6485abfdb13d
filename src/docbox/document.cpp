#include "document.h"

#include <algorithm>
#include <stdexcept>

#include "pdf.h"
#include "zip.h"
#include "utils.h"

namespace {

constexpr size_t kMaxDocumentBytes = 16 << 20;
constexpr size_t kMaxTableCells = 100000;

const char kXmlHeader[] = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
const char kWordNamespace[] = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

const char kContentTypes[] =
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "<Override PartName=\"/word/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
    "</Types>";

const char kPackageRels[] =
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"word/document.xml\"/>"
    "</Relationships>";

const char kDocumentRels[] =
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>"
    "</Relationships>";

struct HeadingFormat {
  const char* style_id;
  const char* style_name;
  double size;
  bool italic;
};

// index is the heading level
const HeadingFormat kHeadings[] = {
  {"Title", "Title", 26, false},
  {"Heading1", "heading 1", 18, false},
  {"Heading2", "heading 2", 15, false},
  {"Heading3", "heading 3", 13, false},
  {"Heading4", "heading 4", 12, true},
};
constexpr int kMaxHeadingLevel = 4;
constexpr double kBodySize = 11;

std::string StylesXml() {
  std::string ret = kXmlHeader;
  ret += std::string("<w:styles xmlns:w=\"") + kWordNamespace + "\">";
  ret += "<w:docDefaults><w:rPrDefault><w:rPr>"
         "<w:rFonts w:ascii=\"Calibri\" w:hAnsi=\"Calibri\" w:cs=\"Calibri\"/>"
         "<w:sz w:val=\"22\"/></w:rPr></w:rPrDefault>"
         "<w:pPrDefault><w:pPr><w:spacing w:after=\"160\" w:line=\"259\" w:lineRule=\"auto\"/>"
         "</w:pPr></w:pPrDefault></w:docDefaults>";
  ret += "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>";
  for (int level = 0; level <= kMaxHeadingLevel; level++) {
    auto& h = kHeadings[level];
    ret += std::string("<w:style w:type=\"paragraph\" w:styleId=\"") + h.style_id + "\">";
    ret += std::string("<w:name w:val=\"") + h.style_name + "\"/>";
    ret += "<w:basedOn w:val=\"Normal\"/><w:next w:val=\"Normal\"/><w:qFormat/>";
    ret += "<w:pPr><w:keepNext/><w:spacing w:before=\"240\" w:after=\"80\"/>";
    if (level) ret += "<w:outlineLvl w:val=\"" + std::to_string(level - 1) + "\"/>";
    ret += "</w:pPr><w:rPr><w:b/>";
    if (h.italic) ret += "<w:i/>";
    ret += "<w:sz w:val=\"" + std::to_string((int)(h.size * 2)) + "\"/></w:rPr></w:style>";
  }
  ret += "<w:style w:type=\"paragraph\" w:styleId=\"ListBullet\"><w:name w:val=\"List Bullet\"/>"
         "<w:basedOn w:val=\"Normal\"/><w:pPr><w:ind w:left=\"720\" w:hanging=\"360\"/></w:pPr></w:style>";
  ret += "<w:style w:type=\"table\" w:styleId=\"TableGrid\"><w:name w:val=\"Table Grid\"/>"
         "<w:tblPr><w:tblBorders>"
         "<w:top w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "<w:left w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "<w:bottom w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "<w:right w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "<w:insideH w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "<w:insideV w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"auto\"/>"
         "</w:tblBorders></w:tblPr></w:style>";
  ret += "</w:styles>";
  return ret;
}

const char* WordAlignment(Alignment align) {
  switch (align) {
    case Alignment::LEFT: return "left";
    case Alignment::CENTER: return "center";
    case Alignment::RIGHT: return "right";
    case Alignment::JUSTIFY: return "both";
  }
  __builtin_unreachable();
}

// one run per line; '\n' becomes a line break inside the paragraph
std::string Runs(const std::string& text, const TextStyle& style) {
  std::string rpr;
  if (style.bold) rpr += "<w:b/>";
  if (style.italic) rpr += "<w:i/>";
  if (style.size > 0) rpr += "<w:sz w:val=\"" + std::to_string((int)(style.size * 2 + 0.5)) + "\"/>";
  if (rpr.size()) rpr = "<w:rPr>" + rpr + "</w:rPr>";
  std::string ret = "<w:r>" + rpr;
  size_t pos = 0;
  while (true) {
    size_t end = text.find('\n', pos);
    std::string line = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    ret += "<w:t xml:space=\"preserve\">" + XmlEscape(line) + "</w:t>";
    if (end == std::string::npos) break;
    ret += "<w:br/>";
    pos = end + 1;
  }
  ret += "</w:r>";
  return ret;
}

std::string Paragraph(const char* style_id, const std::string& text, const TextStyle& style) {
  std::string ret = "<w:p>";
  std::string ppr;
  if (style_id) ppr += std::string("<w:pStyle w:val=\"") + style_id + "\"/>";
  if (style.align != Alignment::LEFT) ppr += std::string("<w:jc w:val=\"") + WordAlignment(style.align) + "\"/>";
  if (ppr.size()) ret += "<w:pPr>" + ppr + "</w:pPr>";
  if (text.size()) ret += Runs(text, style);
  ret += "</w:p>";
  return ret;
}

std::string TableXml(const std::vector<std::vector<std::string>>& rows) {
  size_t cols = 0;
  for (auto& row : rows) cols = std::max(cols, row.size());
  // text width of an A4 page with 1" margins, in twips
  const int kTextWidth = 9026;
  int col_width = cols ? kTextWidth / cols : kTextWidth;
  std::string ret = "<w:tbl><w:tblPr><w:tblStyle w:val=\"TableGrid\"/>"
                    "<w:tblW w:w=\"0\" w:type=\"auto\"/></w:tblPr><w:tblGrid>";
  for (size_t i = 0; i < cols; i++) ret += "<w:gridCol w:w=\"" + std::to_string(col_width) + "\"/>";
  ret += "</w:tblGrid>";
  for (auto& row : rows) {
    ret += "<w:tr>";
    for (size_t i = 0; i < cols; i++) {
      ret += "<w:tc><w:tcPr><w:tcW w:w=\"" + std::to_string(col_width) + "\" w:type=\"dxa\"/></w:tcPr>";
      ret += Paragraph(nullptr, i < row.size() ? row[i] : "", TextStyle());
      ret += "</w:tc>";
    }
    ret += "</w:tr>";
  }
  ret += "</w:tbl>";
  return ret;
}

/// PDF layout

constexpr double kMargin = 72;
constexpr double kLineSpacing = 1.25;
constexpr double kListIndent = 18;
constexpr double kCellPadding = 4;

class Layout {
  PdfWriter pdf_;
  double y_;
 public:
  Layout() : pdf_(kA4Width, kA4Height), y_(kA4Height - kMargin) {}

  double text_width() const { return kA4Width - 2 * kMargin; }

  void NewPage() {
    pdf_.ShowPage();
    y_ = kA4Height - kMargin;
  }

  // moves down by height, starting a new page if it does not fit
  double Reserve(double height) {
    if (y_ - height < kMargin && y_ < kA4Height - kMargin) NewPage();
    double top = y_;
    y_ -= height;
    return top;
  }

  void Space(double height) {
    y_ -= height;
  }

  void Text(const std::string& text, PdfFont font, double size, Alignment align, double indent,
            const std::string& first_prefix = "") {
    double width = text_width() - indent;
    auto lines = WrapToWidth(text, font, size, width);
    for (size_t i = 0; i < lines.size(); i++) {
      double top = Reserve(size * kLineSpacing);
      double x = kMargin + indent;
      double line_width = TextWidth(lines[i], font, size);
      if (align == Alignment::CENTER) x += (width - line_width) / 2;
      if (align == Alignment::RIGHT) x += width - line_width;
      pdf_.SetFont(font, size);
      if (i == 0 && first_prefix.size()) {
        pdf_.DrawText(x - TextWidth(first_prefix, font, size), top - size, first_prefix);
      }
      if (lines[i].size()) pdf_.DrawText(x, top - size, lines[i]);
    }
  }

  void Table(const std::vector<std::vector<std::string>>& rows) {
    size_t cols = 0;
    for (auto& row : rows) cols = std::max(cols, row.size());
    if (!cols) return;
    double col_width = text_width() / cols;
    double line = kBodySize * kLineSpacing;
    for (auto& row : rows) {
      std::vector<std::vector<std::string>> cells(cols);
      size_t max_lines = 1;
      for (size_t i = 0; i < cols; i++) {
        if (i < row.size()) cells[i] = WrapToWidth(row[i], PdfFont::HELVETICA, kBodySize, col_width - 2 * kCellPadding);
        max_lines = std::max(max_lines, cells[i].size());
      }
      double height = max_lines * line + 2 * kCellPadding;
      double top = Reserve(height);
      // graphics state does not survive a page break
      pdf_.SetLineWidth(0.5);
      pdf_.SetFont(PdfFont::HELVETICA, kBodySize);
      for (size_t i = 0; i < cols; i++) {
        double x = kMargin + i * col_width;
        pdf_.Rect(x, top - height, col_width, height, true, false);
        for (size_t j = 0; j < cells[i].size(); j++) {
          if (cells[i][j].empty()) continue;
          pdf_.DrawText(x + kCellPadding, top - kCellPadding - j * line - kBodySize, cells[i][j]);
        }
      }
    }
  }

  std::string Finish() { return pdf_.Finish(); }
};

} // namespace

std::optional<Alignment> ParseAlignment(const std::string& str) {
#define X(name, abr) if (str == abr) return Alignment::name;
  ENUM_ALIGNMENT_
#undef X
  return std::nullopt;
}

void Document::Account(size_t bytes) {
  total_bytes_ += bytes + 16;
  if (total_bytes_ > kMaxDocumentBytes) throw std::length_error("document too large");
}

void Document::AddHeading(const std::string& text, int level) {
  if (level < 0 || level > kMaxHeadingLevel) {
    throw std::invalid_argument("heading level must be between 0 and " + std::to_string(kMaxHeadingLevel));
  }
  Account(text.size());
  Block block;
  block.kind = BlockKind::HEADING;
  block.text = text;
  block.level = level;
  blocks_.push_back(std::move(block));
}

void Document::AddParagraph(const std::string& text, const TextStyle& style) {
  if (style.size < 0 || style.size > 400) throw std::invalid_argument("font size out of range");
  Account(text.size());
  Block block;
  block.kind = BlockKind::PARAGRAPH;
  block.text = text;
  block.style = style;
  blocks_.push_back(std::move(block));
}

void Document::AddListItem(const std::string& text) {
  Account(text.size());
  Block block;
  block.kind = BlockKind::LIST_ITEM;
  block.text = text;
  blocks_.push_back(std::move(block));
}

void Document::AddTable(std::vector<std::vector<std::string>> rows) {
  size_t cells = 0, bytes = 0;
  for (auto& row : rows) {
    cells += row.size();
    for (auto& cell : row) bytes += cell.size();
  }
  if (!cells) throw std::invalid_argument("table needs at least one cell");
  if (cells > kMaxTableCells) throw std::length_error("table too large");
  Account(bytes + cells * 16);
  Block block;
  block.kind = BlockKind::TABLE;
  block.rows = std::move(rows);
  blocks_.push_back(std::move(block));
}

void Document::AddPageBreak() {
  Account(0);
  Block block;
  block.kind = BlockKind::PAGE_BREAK;
  blocks_.push_back(std::move(block));
}

std::string Document::ToDocx() const {
  std::string body = kXmlHeader;
  body += std::string("<w:document xmlns:w=\"") + kWordNamespace + "\"><w:body>";
  for (auto& block : blocks_) {
    switch (block.kind) {
      case BlockKind::HEADING:
        body += Paragraph(kHeadings[block.level].style_id, block.text, TextStyle());
        break;
      case BlockKind::PARAGRAPH:
        body += Paragraph(nullptr, block.text, block.style);
        break;
      case BlockKind::LIST_ITEM:
        body += Paragraph("ListBullet", "\xE2\x80\xA2\t" + block.text, TextStyle());
        break;
      case BlockKind::TABLE:
        body += TableXml(block.rows);
        // Word requires a paragraph between adjacent tables and before </w:body>
        body += "<w:p/>";
        break;
      case BlockKind::PAGE_BREAK:
        body += "<w:p><w:r><w:br w:type=\"page\"/></w:r></w:p>";
        break;
    }
  }
  body += "<w:sectPr><w:pgSz w:w=\"11906\" w:h=\"16838\"/>"
          "<w:pgMar w:top=\"1440\" w:right=\"1440\" w:bottom=\"1440\" w:left=\"1440\" "
          "w:header=\"708\" w:footer=\"708\" w:gutter=\"0\"/></w:sectPr>";
  body += "</w:body></w:document>";

  ZipWriter zip;
  zip.Add("[Content_Types].xml", kXmlHeader + std::string(kContentTypes));
  zip.Add("_rels/.rels", kXmlHeader + std::string(kPackageRels));
  zip.Add("word/document.xml", body);
  zip.Add("word/styles.xml", StylesXml());
  zip.Add("word/_rels/document.xml.rels", kXmlHeader + std::string(kDocumentRels));
  return zip.Finish();
}

std::string Document::ToPdf() const {
  Layout layout;
  for (auto& block : blocks_) {
    switch (block.kind) {
      case BlockKind::HEADING: {
        auto& h = kHeadings[block.level];
        layout.Space(h.size * 0.5);
        layout.Text(block.text, StyledFont(true, h.italic), h.size,
                    block.level ? Alignment::LEFT : Alignment::CENTER, 0);
        layout.Space(h.size * 0.25);
        break;
      }
      case BlockKind::PARAGRAPH: {
        double size = block.style.size > 0 ? block.style.size : kBodySize;
        layout.Text(block.text, StyledFont(block.style.bold, block.style.italic), size, block.style.align, 0);
        layout.Space(size * 0.6);
        break;
      }
      case BlockKind::LIST_ITEM:
        layout.Text(block.text, PdfFont::HELVETICA, kBodySize, Alignment::LEFT, kListIndent,
                    "\xE2\x80\xA2 ");
        layout.Space(kBodySize * 0.2);
        break;
      case BlockKind::TABLE:
        layout.Table(block.rows);
        layout.Space(kBodySize * 0.6);
        break;
      case BlockKind::PAGE_BREAK:
        layout.NewPage();
        break;
    }
  }
  return layout.Finish();
}
