#ifndef DOCBOX_ZIP_H_
#define DOCBOX_ZIP_H_

#include <string>
#include <vector>
#include <cstdint>

// Writes a ZIP archive into memory; entries are deflated with zlib unless
// that does not make them smaller. No zip64: archives stay far below 4 GiB.
class ZipWriter {
  struct Entry {
    std::string name;
    uint32_t crc;
    uint32_t compressed_size;
    uint32_t size;
    uint32_t offset;
    uint16_t method;
  };
  std::string out_;
  std::vector<Entry> entries_;
  bool finished_;
 public:
  ZipWriter() : finished_(false) {}

  // throws std::runtime_error if compression fails or the archive is finished
  void Add(const std::string& name, const std::string& data);
  // central directory and end record; the writer is unusable afterwards
  std::string Finish();
};

#endif  // DOCBOX_ZIP_H_
