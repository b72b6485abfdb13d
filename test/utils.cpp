#include "utils.h"

#include <fstream>
#include <sstream>
#include <docbox/paths.h>

#include "../src/docbox/utils.h"

TempDir::TempDir(const std::string& prefix) :
    path_(kJobRoot / (".test_" + prefix + "_" + RandomHex(8))) {
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

void WriteScript(const fs::path& path, const std::string& body) {
  {
    std::ofstream fout(path);
    fout << "#!/bin/sh\n" << body << '\n';
  }
  fs::permissions(path, fs::perms::owner_all);
}

std::optional<ScriptFailure> RunScript(const std::string& source, const fs::path& dir,
                                       const Policy& policy, size_t memory_limit) {
  Runtime runtime(policy, dir, memory_limit);
  return runtime.Execute(source);
}
