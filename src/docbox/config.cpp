#include <docbox/config.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <docbox/job.h>
#include <docbox/paths.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8720;
int kMaxParallel = 4;

namespace {

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t end = str.find(',', pos);
    if (end == std::string::npos) end = str.size();
    size_t l = str.find_first_not_of(" \t", pos);
    size_t r = str.find_last_not_of(" \t", end ? end - 1 : 0);
    if (l != std::string::npos && l < end && r != std::string::npos && r >= l) {
      ret.push_back(str.substr(l, r - l + 1));
    }
    pos = end + 1;
  }
  return ret;
}

} // namespace

bool ParseConfig(const fs::path& conf_path, Policy& policy) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string job_root = ini[""]["job_root"] | "";
  std::string worker_path = ini[""]["worker_path"] | "";
  if (job_root.size()) kJobRoot = job_root;
  if (worker_path.size()) kWorkerPath = worker_path;
  kJobDeadlineMs = ini[""]["deadline_ms"] | kJobDeadlineMs;
  kTerminateGraceMs = ini[""]["terminate_grace_ms"] | kTerminateGraceMs;
  kRetentionSec = ini[""]["retention_sec"] | kRetentionSec;
  kMaxMemoryMiB = ini[""]["max_memory_mb"] | kMaxMemoryMiB;
  kMaxOutputMiB = ini[""]["max_output_mb"] | kMaxOutputMiB;
  kMaxSourceKiB = ini[""]["max_source_kb"] | kMaxSourceKiB;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  kMaxParallel = ini[""]["max_parallel"] | kMaxParallel;
  if (kJobDeadlineMs <= 0 || kTerminateGraceMs < 0 || kRetentionSec < 0 || kMaxMemoryMiB < 0 ||
      kMaxOutputMiB <= 0 || kMaxSourceKiB <= 0 || kMaxParallel <= 0 ||
      kListenPort <= 0 || kListenPort > 65535) {
    spdlog::error("Configuration {} has out-of-range values", conf_path.c_str());
    return false;
  }

  std::string modules = ini[""]["modules"] | "";
  if (modules.size()) {
    auto list = SplitList(modules);
    policy = policy.WithModules(std::set<std::string>(list.begin(), list.end()));
  }
  for (auto& cap : policy.OutputCapabilities()) {
    std::string exts = ini["extensions"][cap] | "";
    if (exts.empty()) continue;
    policy = policy.WithExtensions(cap, SplitList(exts));
    spdlog::debug("Extensions of {}: {}", cap, exts);
  }
  return true;
}
