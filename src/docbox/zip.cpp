#include "zip.h"

#include <limits>
#include <stdexcept>

#include <zlib.h>

namespace {

// 1980-01-01 00:00; fixed so that equal input gives equal archives
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = 0x21;
constexpr uint16_t kStored = 0;
constexpr uint16_t kDeflated = 8;
constexpr uint16_t kVersion = 20;
// bit 11: names are UTF-8
constexpr uint16_t kFlags = 0x0800;

void Put16(std::string& out, uint16_t x) {
  out.push_back(x & 0xFF);
  out.push_back(x >> 8 & 0xFF);
}

void Put32(std::string& out, uint32_t x) {
  for (int i = 0; i < 4; i++) out.push_back(x >> (8 * i) & 0xFF);
}

// raw deflate stream, as stored in ZIP entries
std::string Deflate(const std::string& data) {
  z_stream strm{};
  if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  std::string ret(deflateBound(&strm, data.size()), '\0');
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = data.size();
  strm.next_out = reinterpret_cast<Bytef*>(ret.data());
  strm.avail_out = ret.size();
  int status = deflate(&strm, Z_FINISH);
  ret.resize(strm.total_out);
  deflateEnd(&strm);
  if (status != Z_STREAM_END) throw std::runtime_error("deflate failed");
  return ret;
}

} // namespace

void ZipWriter::Add(const std::string& name, const std::string& data) {
  if (finished_) throw std::runtime_error("zip archive already finished");
  if (data.size() > std::numeric_limits<uint32_t>::max() / 2 ||
      out_.size() > std::numeric_limits<uint32_t>::max() / 2) {
    throw std::runtime_error("zip archive too large");
  }
  Entry entry;
  entry.name = name;
  entry.crc = crc32(0, reinterpret_cast<const Bytef*>(data.data()), data.size());
  entry.size = data.size();
  entry.offset = out_.size();
  std::string deflated = Deflate(data);
  const std::string* payload = &data;
  if (deflated.size() < data.size()) {
    entry.method = kDeflated;
    payload = &deflated;
  } else {
    entry.method = kStored;
  }
  entry.compressed_size = payload->size();

  Put32(out_, 0x04034b50);
  Put16(out_, kVersion);
  Put16(out_, kFlags);
  Put16(out_, entry.method);
  Put16(out_, kDosTime);
  Put16(out_, kDosDate);
  Put32(out_, entry.crc);
  Put32(out_, entry.compressed_size);
  Put32(out_, entry.size);
  Put16(out_, entry.name.size());
  Put16(out_, 0);
  out_ += entry.name;
  out_ += *payload;
  entries_.push_back(std::move(entry));
}

std::string ZipWriter::Finish() {
  if (finished_) throw std::runtime_error("zip archive already finished");
  finished_ = true;
  uint32_t dir_offset = out_.size();
  for (auto& entry : entries_) {
    Put32(out_, 0x02014b50);
    Put16(out_, kVersion);
    Put16(out_, kVersion);
    Put16(out_, kFlags);
    Put16(out_, entry.method);
    Put16(out_, kDosTime);
    Put16(out_, kDosDate);
    Put32(out_, entry.crc);
    Put32(out_, entry.compressed_size);
    Put32(out_, entry.size);
    Put16(out_, entry.name.size());
    Put16(out_, 0); // extra
    Put16(out_, 0); // comment
    Put16(out_, 0); // disk
    Put16(out_, 0); // internal attributes
    Put32(out_, 0); // external attributes
    Put32(out_, entry.offset);
    out_ += entry.name;
  }
  uint32_t dir_size = out_.size() - dir_offset;
  Put32(out_, 0x06054b50);
  Put16(out_, 0);
  Put16(out_, 0);
  Put16(out_, entries_.size());
  Put16(out_, entries_.size());
  Put32(out_, dir_size);
  Put32(out_, dir_offset);
  Put16(out_, 0);
  return std::move(out_);
}
