#ifndef INCLUDE_DOCBOX_JOB_H_
#define INCLUDE_DOCBOX_JOB_H_

#include <chrono>
#include <future>
#include <string>
#include <filesystem>
#include <sys/types.h>

#include "policy.h"
#include "result.h"

extern long kJobDeadlineMs;
extern long kTerminateGraceMs;
extern long kRetentionSec;
// worker limits
extern long kMaxMemoryMiB; // interpreter heap; address space is derived from it
extern long kMaxOutputMiB; // per file
extern long kMaxSourceKiB;

class Job {
 public:
  // <sanitized caller>_<16 hex digits>; also the directory name
  std::string id;
  std::string caller_id;
  std::string source;
  std::filesystem::path dir;
  std::chrono::system_clock::time_point created;
  std::chrono::steady_clock::time_point deadline;
  // for diagnostics; the process is always reaped when RunJob returns
  pid_t worker_pid;
  int wait_status; // as returned by waitpid; -1 if the worker never ran
  ExecutionResult result;

  Job() : worker_pid(-1), wait_status(-1) {}
};

std::string SanitizeCallerId(const std::string&);

// Blocks the calling thread until the job reaches a terminal outcome.
// Always produces a result; never throws.
ExecutionResult RunJob(const Policy&, Job&);
ExecutionResult RunJob(const Policy&, const std::string& source, const std::string& caller_id);

// Runs the job on its own thread
std::future<ExecutionResult> SubmitJob(const Policy&, std::string source, std::string caller_id);

/// Deferred deletion of job directories

// Removes every file of the directory and the directory itself. Errors are
// swallowed; calling it again or on a missing directory is harmless.
// Only directories directly under kJobRoot are touched.
void CleanupJobDir(const std::filesystem::path&);
void ScheduleCleanup(const std::filesystem::path&, std::chrono::seconds delay);
size_t PendingCleanupCount();
// Runs all pending deletions now
void FlushCleanup();

#endif  // INCLUDE_DOCBOX_JOB_H_
