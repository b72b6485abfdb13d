#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>
#include <gtest/gtest.h>
#include <docbox/policy.h>

#include "docbox/runtime.h"

namespace fs = std::filesystem;

// A fresh directory under the test job root, removed on destruction
class TempDir {
  fs::path path_;
 public:
  explicit TempDir(const std::string& prefix = "tmp");
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
};

std::string ReadAll(const fs::path&);
// Writes an executable /bin/sh script
void WriteScript(const fs::path&, const std::string& body);

// Runs source in a fresh interpreter writing to dir
std::optional<ScriptFailure> RunScript(const std::string& source, const fs::path& dir,
                                       const Policy& policy = Policy::Default(),
                                       size_t memory_limit = 64 << 20);

#endif // TEST_UTILS_H_
