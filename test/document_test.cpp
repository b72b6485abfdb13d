#include <map>
#include <iterator>
#include <zlib.h>
#include <gtest/gtest.h>

#include "docbox/zip.h"
#include "docbox/pdf.h"
#include "docbox/document.h"
#include "docbox/slides.h"
#include "utils.h"

namespace {

uint32_t Get16(const std::string& s, size_t pos) {
  return (uint8_t)s[pos] | (uint8_t)s[pos + 1] << 8;
}
uint32_t Get32(const std::string& s, size_t pos) {
  return Get16(s, pos) | Get16(s, pos + 2) << 16;
}

std::string Inflate(const std::string& data, size_t size) {
  std::string ret(size, '\0');
  z_stream strm{};
  if (inflateInit2(&strm, -15) != Z_OK) return "";
  strm.next_in = (Bytef*)data.data();
  strm.avail_in = data.size();
  strm.next_out = (Bytef*)ret.data();
  strm.avail_out = ret.size();
  int status = inflate(&strm, Z_FINISH);
  inflateEnd(&strm);
  return status == Z_STREAM_END ? ret : "";
}

// Reads the archive back through its central directory
std::map<std::string, std::string> Unzip(const std::string& zip) {
  std::map<std::string, std::string> ret;
  size_t eocd = zip.size() - 22;
  EXPECT_EQ(Get32(zip, eocd), 0x06054b50u);
  size_t entries = Get16(zip, eocd + 10);
  size_t pos = Get32(zip, eocd + 16);
  for (size_t i = 0; i < entries; i++) {
    EXPECT_EQ(Get32(zip, pos), 0x02014b50u);
    uint32_t method = Get16(zip, pos + 10);
    uint32_t crc = Get32(zip, pos + 16);
    uint32_t csize = Get32(zip, pos + 20), size = Get32(zip, pos + 24);
    size_t name_len = Get16(zip, pos + 28);
    size_t skip = name_len + Get16(zip, pos + 30) + Get16(zip, pos + 32);
    size_t local = Get32(zip, pos + 42);
    std::string name = zip.substr(pos + 46, name_len);
    EXPECT_EQ(Get32(zip, local), 0x04034b50u);
    size_t data_pos = local + 30 + Get16(zip, local + 26) + Get16(zip, local + 28);
    std::string data = zip.substr(data_pos, csize);
    if (method == 8) data = Inflate(data, size);
    EXPECT_EQ(data.size(), size) << name;
    EXPECT_EQ(crc32(0, (const Bytef*)data.data(), data.size()), crc) << name;
    ret[name] = data;
    pos += 46 + skip;
  }
  return ret;
}

size_t Count(const std::string& str, const std::string& sub) {
  size_t ret = 0;
  for (size_t pos = str.find(sub); pos != std::string::npos; pos = str.find(sub, pos + 1)) ret++;
  return ret;
}

void ExpectPdf(const std::string& pdf, size_t pages) {
  EXPECT_EQ(pdf.rfind("%PDF-1.4\n", 0), 0u);
  EXPECT_EQ(pdf.substr(pdf.size() - 6), "%%EOF\n");
  EXPECT_NE(pdf.find("/Count " + std::to_string(pages) + " "), std::string::npos);
  EXPECT_EQ(Count(pdf, "/Type /Page "), pages);
}

} // namespace

TEST(Zip, StoredAndDeflated) {
  ZipWriter zip;
  std::string repetitive(10000, 'a');
  zip.Add("a.txt", repetitive);
  zip.Add("dir/b.bin", "\x01\x02");
  std::string data = zip.Finish();
  EXPECT_LT(data.size(), 1000u);
  auto files = Unzip(data);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files["a.txt"], repetitive);
  EXPECT_EQ(files["dir/b.bin"], "\x01\x02");
}

TEST(Zip, FinishedWriterRejectsAdd) {
  ZipWriter zip;
  zip.Finish();
  EXPECT_THROW(zip.Add("x", "y"), std::runtime_error);
}

TEST(Pdf, Text) {
  EXPECT_EQ(ToWinAnsi("caf\xC3\xA9 \xE2\x82\xAC \xE4\xB8\xAD"), "caf\xE9 \x80 ?");
  EXPECT_DOUBLE_EQ(TextWidth("MM", PdfFont::COURIER, 10), 12);
  EXPECT_GT(TextWidth("W", PdfFont::HELVETICA, 10), TextWidth("i", PdfFont::HELVETICA, 10));
  auto lines = WrapToWidth("alpha beta gamma delta", PdfFont::COURIER, 10, 66);
  EXPECT_EQ(lines, (std::vector<std::string>{"alpha beta", "gamma delta"}));
  EXPECT_EQ(ParsePdfFont("Helvetica-Bold"), PdfFont::HELVETICA_BOLD);
  EXPECT_FALSE(ParsePdfFont("Comic Sans").has_value());
}

TEST(Pdf, Pages) {
  PdfWriter pdf(kA4Width, kA4Height);
  pdf.SetFont(PdfFont::HELVETICA, 12);
  pdf.DrawText(72, 720, "first (page)");
  pdf.ShowPage();
  pdf.Rect(10, 10, 100, 100, true, false);
  pdf.Circle(50, 50, 20, false, true);
  ExpectPdf(pdf.Finish(), 2);

  PdfWriter empty(kLetterWidth, kLetterHeight);
  std::string data = empty.Finish();
  ExpectPdf(data, 1);
  EXPECT_NE(data.find("/MediaBox [0 0 612 792]"), std::string::npos);
}

TEST(Document, Docx) {
  Document doc;
  doc.AddHeading("Quarterly <Report>", 0);
  doc.AddHeading("Summary", 1);
  TextStyle style;
  style.bold = true;
  style.align = Alignment::CENTER;
  doc.AddParagraph("Revenue & costs", style);
  doc.AddListItem("item");
  doc.AddTable({{"a", "b"}, {"c"}});
  doc.AddPageBreak();
  auto files = Unzip(doc.ToDocx());
  for (auto name : {"[Content_Types].xml", "_rels/.rels", "word/document.xml", "word/styles.xml",
                    "word/_rels/document.xml.rels"}) {
    EXPECT_TRUE(files.count(name)) << name;
  }
  auto& body = files["word/document.xml"];
  EXPECT_NE(body.find("Quarterly &lt;Report&gt;"), std::string::npos);
  EXPECT_NE(body.find("Revenue &amp; costs"), std::string::npos);
  EXPECT_NE(body.find("<w:tbl>"), std::string::npos);
  EXPECT_NE(body.find("w:type=\"page\""), std::string::npos);
  EXPECT_NE(body.find("<w:sectPr>"), std::string::npos);
}

TEST(Document, Pdf) {
  Document doc;
  doc.AddHeading("Title", 0);
  for (int i = 0; i < 200; i++) doc.AddParagraph("A paragraph long enough to need wrapping on an A4 page "
                                                 "with one inch margins on both sides.", TextStyle());
  std::string pdf = doc.ToPdf();
  size_t pages = Count(pdf, "/Type /Page ");
  EXPECT_GT(pages, 2u);
  ExpectPdf(pdf, pages);
}

TEST(Document, InvalidInput) {
  Document doc;
  EXPECT_THROW(doc.AddHeading("x", 5), std::invalid_argument);
  EXPECT_THROW(doc.AddHeading("x", -1), std::invalid_argument);
  EXPECT_THROW(doc.AddTable({}), std::invalid_argument);
  EXPECT_THROW(doc.AddParagraph(std::string(17 << 20, 'x'), TextStyle()), std::length_error);
  EXPECT_TRUE(doc.blocks().empty());
}

TEST(Presentation, Pptx) {
  Presentation deck;
  deck.AddSlide({"Intro", "Hello\nworld", {"one", "two"}});
  deck.AddSlide({"Second", "", {}});
  EXPECT_EQ(deck.slide_count(), 2u);
  auto files = Unzip(deck.ToPptx());
  for (auto name : {"[Content_Types].xml", "ppt/presentation.xml", "ppt/_rels/presentation.xml.rels",
                    "ppt/slideMasters/slideMaster1.xml", "ppt/slideLayouts/slideLayout1.xml",
                    "ppt/theme/theme1.xml", "ppt/slides/slide1.xml", "ppt/slides/slide2.xml",
                    "ppt/slides/_rels/slide2.xml.rels"}) {
    EXPECT_TRUE(files.count(name)) << name;
  }
  auto& slide = files["ppt/slides/slide1.xml"];
  EXPECT_NE(slide.find("<a:t>Intro</a:t>"), std::string::npos);
  EXPECT_EQ(Count(slide, "<a:buChar"), 2u);
  EXPECT_EQ(Count(files["ppt/presentation.xml"], "<p:sldId "), 2u);
  EXPECT_NE(files["[Content_Types].xml"].find("/ppt/slides/slide2.xml"), std::string::npos);
}

TEST(Presentation, Pdf) {
  Presentation deck;
  deck.AddSlide({"One", "body", {"x"}});
  deck.AddSlide({"Two", "", {}});
  deck.AddSlide({});
  std::string pdf = deck.ToPdf();
  ExpectPdf(pdf, 3);
  EXPECT_NE(pdf.find("/MediaBox [0 0 960 540]"), std::string::npos);
}

TEST(Capabilities, SaveFromScript) {
  TempDir dir("caps");
  auto failure = RunScript(R"(
local docx = require('docx')
local d = docx.Document()
d:add_heading('Report', 0):add_paragraph('text', {bold = true, align = 'center'})
d:add_table({{'a', 'b'}, {1, 2}})
assert(d:save('../../tmp/report.docx') == 'report.docx')
assert(d:save('report.pdf') == 'report.pdf')

local pptx = require('pptx')
local p = pptx.Presentation()
assert(p:add_slide({title = 'T', bullets = {'a', 'b'}}) == 1)
assert(p:slide_count() == 1)
p:save('deck.pptx')

local canvas = require('canvas')
local c = canvas.Canvas('/etc/chart.pdf', canvas.letter)
c:setFont('Helvetica-Bold', 14)
c:drawCentredString(306, 700, 'Chart')
c:setFillColorRGB(0.2, 0.4, 0.6)
c:rect(100, 100, 200, 300, 1, 1)
c:showPage()
c:drawString(72, 72, 'page two')
assert(c:stringWidth('abc') > 0)
assert(c:save() == 'chart.pdf')
assert(not pcall(c.drawString, c, 1, 1, 'after save'))
)", dir.path());
  if (failure) FAIL() << failure->message;
  for (auto name : {"report.docx", "report.pdf", "deck.pptx", "chart.pdf"}) {
    EXPECT_TRUE(fs::is_regular_file(dir.path() / name)) << name;
  }
  ExpectPdf(ReadAll(dir.path() / "chart.pdf"), 2);
  EXPECT_EQ(std::distance(fs::directory_iterator(dir.path()), fs::directory_iterator()), 4);
}

TEST(Capabilities, RejectedSave) {
  TempDir dir("caps");
  auto failure = RunScript("require('pptx').Presentation():save('deck.docx')", dir.path());
  ASSERT_TRUE(failure);
  EXPECT_EQ(failure->kind, DiagnosticKind::POLICY);
  failure = RunScript("require('canvas').Canvas('x.pdf'):setFont('Wingdings', 10)", dir.path());
  ASSERT_TRUE(failure);
  EXPECT_EQ(failure->kind, DiagnosticKind::RUNTIME);
  EXPECT_TRUE(fs::is_empty(dir.path()));
}

TEST(Capabilities, SlideFieldsIgnoreMetatable) {
  TempDir dir("caps");
  auto failure = RunScript(R"(
local pptx = require('pptx')
local p = pptx.Presentation()
local slide = setmetatable({title = string.rep('x', 100)}, {__index = function() error('boom') end})
assert(p:add_slide(slide) == 1)
assert(p:slide_count() == 1)
)", dir.path());
  if (failure) FAIL() << failure->message;
}
