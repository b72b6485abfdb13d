#include <docbox/paths.h>

fs::path kJobRoot = "/tmp/docbox_jobs";
fs::path kWorkerPath;

namespace internal {
fs::path kDataDir = fs::path(DOCBOX_DATA_DIR);
} // internal

namespace {

const char kStagingRelative[] = ".staging";
const char kSourceName[] = "script.lua";
const char kPolicyName[] = "policy.json";
const char kWorkerLogName[] = "worker.log";
const char kWorkerName[] = "docbox-worker";

} // namespace

fs::path WorkerPath() {
  if (!kWorkerPath.empty()) return kWorkerPath;
  return internal::kDataDir / kWorkerName;
}

fs::path JobPath(const std::string& job_id) {
  return kJobRoot / job_id;
}

fs::path JobStagingPath(const std::string& job_id) {
  return kJobRoot / kStagingRelative / job_id;
}

fs::path JobSourceFile(const std::string& job_id) {
  return JobStagingPath(job_id) / kSourceName;
}

fs::path JobPolicyFile(const std::string& job_id) {
  return JobStagingPath(job_id) / kPolicyName;
}

fs::path JobWorkerLog(const std::string& job_id) {
  return JobStagingPath(job_id) / kWorkerLogName;
}
