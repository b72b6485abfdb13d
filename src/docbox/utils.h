#ifndef DOCBOX_UTILS_H_
#define DOCBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <docbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// Never follows a symlink at the final component; truncates existing files
bool WriteOutputFile(const fs::path&, const std::string& data);
bool WriteFile(const fs::path&, const std::string& data, fs::perms = fs::perms::owner_read | fs::perms::owner_write);
// false if unreadable or larger than max_size
bool ReadFile(const fs::path&, size_t max_size, std::string& data);
// last max_size bytes at most
std::string ReadFileTail(const fs::path&, size_t max_size);

// n random lowercase hex digits from std::random_device
std::string RandomHex(size_t n);

std::string XmlEscape(const std::string&);
// Cuts at max_len bytes without splitting a UTF-8 sequence
std::string Utf8Prefix(const std::string&, size_t max_len);
size_t Utf8Length(const std::string&);

#endif  // DOCBOX_UTILS_H_
