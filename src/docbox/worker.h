#ifndef DOCBOX_WORKER_H_
#define DOCBOX_WORKER_H_

#include <csignal>
#include <string>
#include <vector>
#include <filesystem>

#include <docbox/policy.h>
#include <docbox/result.h>

#include "protocol.h"

#define ENUM_WORKER_STATE_ \
  X(STARTING, "starting") \
  X(PREPARING, "preparing") \
  X(EXECUTING, "executing") \
  X(COLLECTING, "collecting") \
  X(REPORTING, "reporting") \
  X(TERMINAL, "terminal")
enum class WorkerState {
#define X(name, str) name,
  ENUM_WORKER_STATE_
#undef X
};

const char* WorkerStateName(WorkerState);

struct WorkerOptions {
  std::filesystem::path job_dir;
  std::filesystem::path source_file;
  size_t memory_limit = 0; // bytes; 0 means unlimited
  size_t max_source_size = 1 << 20;
};

// Regular files (never symlinks) directly in job_dir whose extension is a
// permitted output, as absolute paths sorted by name
std::vector<std::string> CollectOutputs(const Policy&, const std::filesystem::path& job_dir);

// Drives one script from start to its single result. States only move forward.
class Worker {
 public:
  Worker(const Policy& policy, WorkerOptions opts, const volatile sig_atomic_t* interrupt = nullptr) :
      policy_(policy), opts_(std::move(opts)), interrupt_(interrupt), state_(WorkerState::STARTING) {}

  // Runs to TERMINAL, reporting exactly one result on the channel.
  // Returns the reported result; never throws.
  ExecutionResult Run(ResultChannel& channel);

  WorkerState state() const { return state_; }

 private:
  void Transition(WorkerState next);
  ExecutionResult Execute();

  const Policy& policy_;
  WorkerOptions opts_;
  const volatile sig_atomic_t* interrupt_;
  WorkerState state_;
};

#endif  // DOCBOX_WORKER_H_
