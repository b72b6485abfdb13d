#include "slides.h"

#include <stdexcept>

#include "pdf.h"
#include "zip.h"
#include "utils.h"

namespace {

constexpr size_t kMaxDeckBytes = 16 << 20;
constexpr size_t kMaxSlides = 1000;

// 16:9 in EMU
constexpr long kSlideWidth = 12192000;
constexpr long kSlideHeight = 6858000;
constexpr long kEmuPerPoint = 12700;

const char kXmlHeader[] = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
const char kNamespaces[] =
    " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
    " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""
    " xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"";
const char kRelsNamespace[] = "http://schemas.openxmlformats.org/package/2006/relationships";
const char kRelType[] = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";
const char kContentTypePrefix[] = "application/vnd.openxmlformats-officedocument.";

const char kEmptyTree[] =
    "<p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
    "<p:grpSpPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"0\" cy=\"0\"/>"
    "<a:chOff x=\"0\" y=\"0\"/><a:chExt cx=\"0\" cy=\"0\"/></a:xfrm></p:grpSpPr>";

const char kTheme[] =
    "<a:theme xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" name=\"Office Theme\">"
    "<a:themeElements><a:clrScheme name=\"Office\">"
    "<a:dk1><a:sysClr val=\"windowText\" lastClr=\"000000\"/></a:dk1>"
    "<a:lt1><a:sysClr val=\"window\" lastClr=\"FFFFFF\"/></a:lt1>"
    "<a:dk2><a:srgbClr val=\"44546A\"/></a:dk2><a:lt2><a:srgbClr val=\"E7E6E6\"/></a:lt2>"
    "<a:accent1><a:srgbClr val=\"4472C4\"/></a:accent1><a:accent2><a:srgbClr val=\"ED7D31\"/></a:accent2>"
    "<a:accent3><a:srgbClr val=\"A5A5A5\"/></a:accent3><a:accent4><a:srgbClr val=\"FFC000\"/></a:accent4>"
    "<a:accent5><a:srgbClr val=\"5B9BD5\"/></a:accent5><a:accent6><a:srgbClr val=\"70AD47\"/></a:accent6>"
    "<a:hlink><a:srgbClr val=\"0563C1\"/></a:hlink><a:folHlink><a:srgbClr val=\"954F72\"/></a:folHlink>"
    "</a:clrScheme><a:fontScheme name=\"Office\">"
    "<a:majorFont><a:latin typeface=\"Calibri Light\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:majorFont>"
    "<a:minorFont><a:latin typeface=\"Calibri\"/><a:ea typeface=\"\"/><a:cs typeface=\"\"/></a:minorFont>"
    "</a:fontScheme><a:fmtScheme name=\"Office\"><a:fillStyleLst>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "</a:fillStyleLst><a:lnStyleLst>"
    "<a:ln w=\"6350\"><a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill></a:ln>"
    "<a:ln w=\"12700\"><a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill></a:ln>"
    "<a:ln w=\"19050\"><a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill></a:ln>"
    "</a:lnStyleLst><a:effectStyleLst>"
    "<a:effectStyle><a:effectLst/></a:effectStyle>"
    "<a:effectStyle><a:effectLst/></a:effectStyle>"
    "<a:effectStyle><a:effectLst/></a:effectStyle>"
    "</a:effectStyleLst><a:bgFillStyleLst>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "<a:solidFill><a:schemeClr val=\"phClr\"/></a:solidFill>"
    "</a:bgFillStyleLst></a:fmtScheme></a:themeElements></a:theme>";

struct Relationship {
  std::string type;
  std::string target;
};

std::string RelsXml(const std::vector<Relationship>& rels) {
  std::string ret = kXmlHeader;
  ret += std::string("<Relationships xmlns=\"") + kRelsNamespace + "\">";
  for (size_t i = 0; i < rels.size(); i++) {
    ret += "<Relationship Id=\"rId" + std::to_string(i + 1) + "\" Type=\"" + kRelType +
           rels[i].type + "\" Target=\"" + rels[i].target + "\"/>";
  }
  ret += "</Relationships>";
  return ret;
}

std::string ContentTypes(size_t slides) {
  std::string pre = kContentTypePrefix;
  std::string ret = kXmlHeader;
  ret += "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
         "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
         "<Default Extension=\"xml\" ContentType=\"application/xml\"/>";
  auto add = [&](const std::string& part, const std::string& type) {
    ret += "<Override PartName=\"" + part + "\" ContentType=\"" + pre + type + "\"/>";
  };
  add("/ppt/presentation.xml", "presentationml.presentation.main+xml");
  add("/ppt/slideMasters/slideMaster1.xml", "presentationml.slideMaster+xml");
  add("/ppt/slideLayouts/slideLayout1.xml", "presentationml.slideLayout+xml");
  add("/ppt/theme/theme1.xml", "theme+xml");
  for (size_t i = 1; i <= slides; i++) {
    add("/ppt/slides/slide" + std::to_string(i) + ".xml", "presentationml.slide+xml");
  }
  ret += "</Types>";
  return ret;
}

std::string TextRun(const std::string& text, int size_hundredths, bool bold) {
  return "<a:r><a:rPr lang=\"en-US\" sz=\"" + std::to_string(size_hundredths) + "\"" +
         (bold ? " b=\"1\"" : "") + " dirty=\"0\"/><a:t>" + XmlEscape(text) + "</a:t></a:r>";
}

std::string TextBox(int id, const char* name, long x, long y, long cx, long cy, const std::string& paragraphs) {
  return "<p:sp><p:nvSpPr><p:cNvPr id=\"" + std::to_string(id) + "\" name=\"" + name + "\"/>"
         "<p:cNvSpPr txBox=\"1\"/><p:nvPr/></p:nvSpPr><p:spPr><a:xfrm>"
         "<a:off x=\"" + std::to_string(x) + "\" y=\"" + std::to_string(y) + "\"/>"
         "<a:ext cx=\"" + std::to_string(cx) + "\" cy=\"" + std::to_string(cy) + "\"/></a:xfrm>"
         "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></p:spPr>"
         "<p:txBody><a:bodyPr wrap=\"square\"><a:normAutofit/></a:bodyPr><a:lstStyle/>" +
         paragraphs + "</p:txBody></p:sp>";
}

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    ret.push_back(text.substr(pos, end - pos));
    pos = end + 1;
  }
  return ret;
}

std::string SlideXml(const Slide& slide) {
  const long margin = 457200;
  const long width = kSlideWidth - 2 * margin;
  std::string tree = kEmptyTree;
  tree += TextBox(2, "Title", margin, 365125, width, 1325563,
                  "<a:p>" + (slide.title.size() ? TextRun(slide.title, 4000, true) : "") + "</a:p>");
  std::string body;
  if (slide.body.size()) {
    for (auto& line : Lines(slide.body)) {
      body += "<a:p>" + (line.size() ? TextRun(line, 2000, false) : "") + "</a:p>";
    }
  }
  for (auto& bullet : slide.bullets) {
    body += "<a:p><a:pPr marL=\"342900\" indent=\"-342900\"><a:buFont typeface=\"Arial\"/>"
            "<a:buChar char=\"\xE2\x80\xA2\"/></a:pPr>" + TextRun(bullet, 2000, false) + "</a:p>";
  }
  if (body.empty()) body = "<a:p/>";
  tree += TextBox(3, "Body", margin, 1825625, width, 4351338, body);

  std::string ret = kXmlHeader;
  ret += std::string("<p:sld") + kNamespaces + "><p:cSld><p:spTree>" + tree +
         "</p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
  return ret;
}

std::string PresentationXml(size_t slides) {
  std::string ret = kXmlHeader;
  ret += std::string("<p:presentation") + kNamespaces + " saveSubsetFonts=\"1\">";
  ret += "<p:sldMasterIdLst><p:sldMasterId id=\"2147483648\" r:id=\"rId1\"/></p:sldMasterIdLst>";
  if (slides) {
    ret += "<p:sldIdLst>";
    // rId1 is the master and rId2 the theme
    for (size_t i = 0; i < slides; i++) {
      ret += "<p:sldId id=\"" + std::to_string(256 + i) + "\" r:id=\"rId" + std::to_string(i + 3) + "\"/>";
    }
    ret += "</p:sldIdLst>";
  }
  ret += "<p:sldSz cx=\"" + std::to_string(kSlideWidth) + "\" cy=\"" + std::to_string(kSlideHeight) + "\"/>";
  ret += "<p:notesSz cx=\"6858000\" cy=\"9144000\"/></p:presentation>";
  return ret;
}

std::string MasterXml() {
  std::string ret = kXmlHeader;
  ret += std::string("<p:sldMaster") + kNamespaces + "><p:cSld><p:spTree>" + kEmptyTree +
         "</p:spTree></p:cSld>"
         "<p:clrMap bg1=\"lt1\" tx1=\"dk1\" bg2=\"lt2\" tx2=\"dk2\" accent1=\"accent1\" accent2=\"accent2\" "
         "accent3=\"accent3\" accent4=\"accent4\" accent5=\"accent5\" accent6=\"accent6\" "
         "hlink=\"hlink\" folHlink=\"folHlink\"/>"
         "<p:sldLayoutIdLst><p:sldLayoutId id=\"2147483649\" r:id=\"rId1\"/></p:sldLayoutIdLst>"
         "</p:sldMaster>";
  return ret;
}

std::string LayoutXml() {
  std::string ret = kXmlHeader;
  ret += std::string("<p:sldLayout") + kNamespaces + " type=\"blank\" preserve=\"1\">"
         "<p:cSld name=\"Blank\"><p:spTree>" + kEmptyTree + "</p:spTree></p:cSld>"
         "<p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sldLayout>";
  return ret;
}

/// PDF rendering

constexpr double kPageWidth = kSlideWidth / (double)kEmuPerPoint;
constexpr double kPageHeight = kSlideHeight / (double)kEmuPerPoint;
constexpr double kPageMargin = 36;
constexpr double kTitleSize = 28;
constexpr double kBodySize = 16;

} // namespace

void Presentation::AddSlide(Slide slide) {
  if (slides_.size() >= kMaxSlides) throw std::length_error("too many slides");
  size_t bytes = slide.title.size() + slide.body.size() + 64;
  for (auto& i : slide.bullets) bytes += i.size() + 16;
  total_bytes_ += bytes;
  if (total_bytes_ > kMaxDeckBytes) throw std::length_error("presentation too large");
  slides_.push_back(std::move(slide));
}

std::string Presentation::ToPptx() const {
  ZipWriter zip;
  zip.Add("[Content_Types].xml", ContentTypes(slides_.size()));
  zip.Add("_rels/.rels", RelsXml({{"officeDocument", "ppt/presentation.xml"}}));

  std::vector<Relationship> pres_rels = {
    {"slideMaster", "slideMasters/slideMaster1.xml"},
    {"theme", "theme/theme1.xml"},
  };
  for (size_t i = 1; i <= slides_.size(); i++) {
    pres_rels.push_back({"slide", "slides/slide" + std::to_string(i) + ".xml"});
  }
  zip.Add("ppt/presentation.xml", PresentationXml(slides_.size()));
  zip.Add("ppt/_rels/presentation.xml.rels", RelsXml(pres_rels));
  zip.Add("ppt/slideMasters/slideMaster1.xml", MasterXml());
  zip.Add("ppt/slideMasters/_rels/slideMaster1.xml.rels", RelsXml({
    {"slideLayout", "../slideLayouts/slideLayout1.xml"},
    {"theme", "../theme/theme1.xml"},
  }));
  zip.Add("ppt/slideLayouts/slideLayout1.xml", LayoutXml());
  zip.Add("ppt/slideLayouts/_rels/slideLayout1.xml.rels", RelsXml({
    {"slideMaster", "../slideMasters/slideMaster1.xml"},
  }));
  zip.Add("ppt/theme/theme1.xml", kXmlHeader + std::string(kTheme));
  for (size_t i = 0; i < slides_.size(); i++) {
    std::string name = "slide" + std::to_string(i + 1) + ".xml";
    zip.Add("ppt/slides/" + name, SlideXml(slides_[i]));
    zip.Add("ppt/slides/_rels/" + name + ".rels", RelsXml({
      {"slideLayout", "../slideLayouts/slideLayout1.xml"},
    }));
  }
  return zip.Finish();
}

std::string Presentation::ToPdf() const {
  PdfWriter pdf(kPageWidth, kPageHeight);
  const double width = kPageWidth - 2 * kPageMargin;
  for (auto& slide : slides_) {
    double y = kPageHeight - kPageMargin;
    auto draw = [&](const std::string& text, PdfFont font, double size, double indent,
                    const std::string& prefix) {
      auto lines = WrapToWidth(text, font, size, width - indent);
      pdf.SetFont(font, size);
      for (size_t i = 0; i < lines.size(); i++) {
        y -= size * 1.2;
        // text past the bottom edge is cut, as on a real slide
        if (y < kPageMargin / 2) return;
        if (i == 0 && prefix.size()) pdf.DrawText(kPageMargin + indent - 12, y, prefix);
        if (lines[i].size()) pdf.DrawText(kPageMargin + indent, y, lines[i]);
      }
    };
    if (slide.title.size()) draw(slide.title, PdfFont::HELVETICA_BOLD, kTitleSize, 0, "");
    y -= kBodySize;
    if (slide.body.size()) draw(slide.body, PdfFont::HELVETICA, kBodySize, 0, "");
    for (auto& bullet : slide.bullets) draw(bullet, PdfFont::HELVETICA, kBodySize, 18, "\xE2\x80\xA2");
    pdf.ShowPage();
  }
  return pdf.Finish();
}
