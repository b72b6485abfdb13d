#include "worker.h"

#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "runtime.h"
#include "utils.h"

const char* WorkerStateName(WorkerState state) {
  switch (state) {
#define X(name, str) case WorkerState::name: return str;
    ENUM_WORKER_STATE_
#undef X
  }
  __builtin_unreachable();
}

std::vector<std::string> CollectOutputs(const Policy& policy, const fs::path& job_dir) {
  std::vector<std::string> ret;
  std::error_code ec;
  fs::directory_iterator it(job_dir, ec), end;
  if (ec) {
    spdlog::warn("Cannot list {}: {}", job_dir.c_str(), ec.message());
    return ret;
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      spdlog::warn("Error while listing {}: {}", job_dir.c_str(), ec.message());
      break;
    }
    auto status = it->symlink_status(ec);
    if (ec || !fs::is_regular_file(status)) continue;
    std::string name = it->path().filename();
    if (!policy.IsPermittedOutput(name)) {
      spdlog::debug("Skipping {}: not a permitted output", name);
      continue;
    }
    ret.push_back(fs::absolute(it->path(), ec).lexically_normal());
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

void Worker::Transition(WorkerState next) {
  spdlog::debug("Worker {} -> {}", WorkerStateName(state_), WorkerStateName(next));
  state_ = next;
}

ExecutionResult Worker::Execute() {
  struct stat st;
  if (stat(opts_.job_dir.c_str(), &st) < 0 || !S_ISDIR(st.st_mode) ||
      access(opts_.job_dir.c_str(), W_OK | X_OK) < 0) {
    spdlog::error("Job directory {} unusable: {}", opts_.job_dir.c_str(), strerror(errno));
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::SETUP,
        "job directory is not a writable directory"));
  }
  std::string source;
  if (!ReadFile(opts_.source_file, opts_.max_source_size, source)) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::SETUP,
        "cannot read the script source"));
  }

  Transition(WorkerState::PREPARING);
  Runtime runtime(policy_, opts_.job_dir, opts_.memory_limit, interrupt_);
  std::optional<ScriptFailure> failure = runtime.Prepare();

  if (!failure) {
    Transition(WorkerState::EXECUTING);
    failure = runtime.Execute(source);
  }

  // entered however execution ended
  Transition(WorkerState::COLLECTING);
  std::vector<std::string> files = CollectOutputs(policy_, opts_.job_dir);
  if (failure) {
    spdlog::info("Script failed with {}; {} output files discarded",
                 DiagnosticKindName(failure->kind), files.size());
    return ExecutionResult::Error(MakeDiagnostic(failure->kind, failure->message, failure->trace));
  }
  spdlog::info("Script succeeded with {} output files", files.size());
  return ExecutionResult::Success(std::move(files));
}

ExecutionResult Worker::Run(ResultChannel& channel) {
  ExecutionResult result;
  try {
    result = Execute();
  } catch (std::bad_alloc&) {
    result = ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::MEMORY, "worker out of memory"));
  } catch (std::exception& e) {
    spdlog::error("Worker failed in state {}: {}", WorkerStateName(state_), e.what());
    result = ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER, e.what()));
  }
  Transition(WorkerState::REPORTING);
  if (!channel.Report(result)) spdlog::error("Failed to report result");
  Transition(WorkerState::TERMINAL);
  return result;
}
