#ifndef INCLUDE_DOCBOX_PATHS_H_
#define INCLUDE_DOCBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Every job gets one private subdirectory under this root
extern fs::path kJobRoot;
// Overrides the worker binary location if not empty
extern fs::path kWorkerPath;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path WorkerPath();

// <job_root>/<job_id>; holds the script's output files only
fs::path JobPath(const std::string& job_id);
// <job_root>/.staging/<job_id>; holds the worker's inputs and log
fs::path JobStagingPath(const std::string& job_id);
fs::path JobSourceFile(const std::string& job_id);
fs::path JobPolicyFile(const std::string& job_id);
fs::path JobWorkerLog(const std::string& job_id);

#endif  // INCLUDE_DOCBOX_PATHS_H_
