#ifndef DOCBOX_DOCUMENT_H_
#define DOCBOX_DOCUMENT_H_

#include <string>
#include <vector>
#include <optional>

#define ENUM_ALIGNMENT_ \
  X(LEFT, "left") \
  X(CENTER, "center") \
  X(RIGHT, "right") \
  X(JUSTIFY, "justify")
enum class Alignment {
#define X(name, str) name,
  ENUM_ALIGNMENT_
#undef X
};

std::optional<Alignment> ParseAlignment(const std::string&);

enum class BlockKind {
  HEADING,
  PARAGRAPH,
  LIST_ITEM,
  TABLE,
  PAGE_BREAK,
};

struct TextStyle {
  bool bold = false;
  bool italic = false;
  double size = 0; // points; 0 means the default for the block
  Alignment align = Alignment::LEFT;
};

struct Block {
  BlockKind kind;
  std::string text;
  int level = 0; // headings only; 0 is the title
  TextStyle style;
  std::vector<std::vector<std::string>> rows; // tables only
};

// A word-processing document built block by block. The mutators throw
// std::invalid_argument on bad input and std::length_error past the size cap.
class Document {
 public:
  Document() : total_bytes_(0) {}

  void AddHeading(const std::string& text, int level);
  void AddParagraph(const std::string& text, const TextStyle& style);
  void AddListItem(const std::string& text);
  void AddTable(std::vector<std::vector<std::string>> rows);
  void AddPageBreak();

  // WordprocessingML package
  std::string ToDocx() const;
  // A4 pages, 72pt margins
  std::string ToPdf() const;

  const std::vector<Block>& blocks() const { return blocks_; }

 private:
  void Account(size_t bytes);

  std::vector<Block> blocks_;
  size_t total_bytes_;
};

#endif  // DOCBOX_DOCUMENT_H_
