#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <random>
#include <fstream>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeName, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG2(DiagnosticKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* DiagnosticKindName, DiagnosticKind, ENUM_DIAGNOSTIC_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

std::optional<Outcome> ParseOutcome(const std::string& str) {
#define X(name, abr) if (str == abr) return Outcome::name;
  ENUM_OUTCOME_
#undef X
  return std::nullopt;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

namespace {

bool WriteAllFd(int fd, const std::string& data) {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t n = write(fd, data.data() + done, data.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    done += n;
  }
  return true;
}

bool WriteWithFlags(const fs::path& path, const std::string& data, int flags, mode_t mode) {
  int fd = open(path.c_str(), flags, mode);
  if (fd < 0) goto err;
  if (!WriteAllFd(fd, data)) {
    int saved = errno;
    close(fd);
    errno = saved;
    goto err;
  }
  if (close(fd) < 0) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

} // namespace

bool WriteOutputFile(const fs::path& path, const std::string& data) {
  spdlog::debug("Write output {} ({} bytes)", path.c_str(), data.size());
  return WriteWithFlags(path, data, O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
}

bool WriteFile(const fs::path& path, const std::string& data, fs::perms perms) {
  return WriteWithFlags(path, data, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, (mode_t)perms);
}

bool ReadFile(const fs::path& path, size_t max_size, std::string& data) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) {
    spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  if (size > max_size) {
    spdlog::warn("Refusing to read {}: {} bytes exceeds {}", path.c_str(), size, max_size);
    return false;
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  data.assign(size, '\0');
  fin.read(data.data(), size);
  data.resize(fin.gcount());
  return true;
}

std::string ReadFileTail(const fs::path& path, size_t max_size) {
  std::ifstream fin(path, std::ios::binary | std::ios::ate);
  if (!fin) return "";
  std::streamoff size = fin.tellg();
  std::streamoff start = size > (std::streamoff)max_size ? size - max_size : 0;
  fin.seekg(start);
  std::string ret(size - start, '\0');
  fin.read(ret.data(), ret.size());
  ret.resize(fin.gcount());
  return ret;
}

std::string RandomHex(size_t n) {
  static const char kDigits[] = "0123456789abcdef";
  std::random_device rd;
  std::string ret;
  ret.reserve(n);
  while (ret.size() < n) {
    unsigned int x = rd();
    for (int i = 0; i < 8 && ret.size() < n; i++, x >>= 4) ret.push_back(kDigits[x & 15]);
  }
  return ret;
}

std::string XmlEscape(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (unsigned char c : str) {
    switch (c) {
      case '&': ret += "&amp;"; break;
      case '<': ret += "&lt;"; break;
      case '>': ret += "&gt;"; break;
      case '"': ret += "&quot;"; break;
      case '\'': ret += "&apos;"; break;
      case '\t': [[fallthrough]];
      case '\n': [[fallthrough]];
      case '\r': ret.push_back(c); break;
      default:
        // control characters are not allowed in XML 1.0
        if (c >= 0x20) ret.push_back(c);
    }
  }
  return ret;
}

std::string Utf8Prefix(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  size_t len = max_len;
  // back off continuation bytes
  while (len > 0 && ((unsigned char)str[len] & 0xC0) == 0x80) len--;
  return str.substr(0, len);
}

size_t Utf8Length(const std::string& str) {
  size_t ret = 0;
  for (unsigned char c : str) {
    if ((c & 0xC0) != 0x80) ret++;
  }
  return ret;
}

ExecutionResult ExecutionResult::Success(std::vector<std::string> files) {
  ExecutionResult ret;
  ret.status = Outcome::SUCCESS;
  ret.files = std::move(files);
  return ret;
}

ExecutionResult ExecutionResult::Error(std::string message) {
  ExecutionResult ret;
  ret.status = Outcome::ERROR;
  ret.message = std::move(message);
  return ret;
}

ExecutionResult ExecutionResult::Timeout(std::string message) {
  ExecutionResult ret;
  ret.status = Outcome::TIMEOUT;
  ret.message = std::move(message);
  return ret;
}
