#include <docbox/job.h>

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <algorithm>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <docbox/paths.h>

#include "protocol.h"
#include "utils.h"

long kJobDeadlineMs = 30000;
long kTerminateGraceMs = 1500;
long kRetentionSec = 15 * 60;
long kMaxMemoryMiB = 256;
long kMaxOutputMiB = 64;
long kMaxSourceKiB = 256;

namespace {

constexpr size_t kMaxCallerIdLength = 32;
constexpr int kJobIdAttempts = 16;
constexpr rlim_t kMaxOpenFiles = 64;
// address space beyond the interpreter heap: code, stacks, render buffers
constexpr rlim_t kAddressSpaceSlackMiB = 256;
constexpr std::chrono::milliseconds kReapInterval(10);

using Clock = std::chrono::steady_clock;

// the child's end of the exec-error pipe after the fd shuffle
constexpr int kErrorFd = 3;

struct WorkerProcess {
  pid_t pid = -1;
  int channel_fd = -1;
};

bool MakeJobDir(Job& job) {
  if (!CreateDirs(kJobRoot, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec)) {
    return false;
  }
  if (!CreateDirs(kJobRoot / ".staging", fs::perms::owner_all)) return false;
  std::string prefix = SanitizeCallerId(job.caller_id) + "_";
  for (int attempt = 0; attempt < kJobIdAttempts; attempt++) {
    std::string id = prefix + RandomHex(16);
    fs::path dir = JobPath(id);
    if (mkdir(dir.c_str(), 0700) < 0) {
      if (errno == EEXIST) continue;
      spdlog::error("Cannot create job directory {}: {}", dir.c_str(), strerror(errno));
      return false;
    }
    if (mkdir(JobStagingPath(id).c_str(), 0700) < 0) {
      spdlog::error("Cannot create staging directory for {}: {}", id, strerror(errno));
      IGNORE_RETURN(rmdir(dir.c_str()));
      return false;
    }
    std::error_code ec;
    job.id = id;
    job.dir = fs::absolute(dir, ec).lexically_normal();
    if (ec) job.dir = dir;
    return true;
  }
  spdlog::error("Cannot find a free job id after {} attempts", kJobIdAttempts);
  return false;
}

void SetLimit(int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  setrlimit(resource, &lim);
}

// Runs in the forked child: async-signal-safe calls only
[[noreturn]] void ExecWorker(int null_fd, int channel_fd, int log_fd, int error_fd,
                             char* const* argv, char* const* envp) {
  // the daemon blocks its shutdown signals in every thread
  sigset_t mask;
  sigemptyset(&mask);
  sigprocmask(SIG_SETMASK, &mask, nullptr);
  setpgid(0, 0);
  if (dup2(null_fd, 0) < 0 || dup2(channel_fd, 1) < 0 || dup2(log_fd, 2) < 0 ||
      dup2(error_fd, kErrorFd) < 0 || fcntl(kErrorFd, F_SETFD, FD_CLOEXEC) < 0) {
    goto err;
  }
  CloseFrom(kErrorFd + 1);
  if (kMaxMemoryMiB > 0) {
    SetLimit(RLIMIT_AS, ((rlim_t)kMaxMemoryMiB * 2 + kAddressSpaceSlackMiB) << 20);
  }
  SetLimit(RLIMIT_FSIZE, (rlim_t)kMaxOutputMiB << 20);
  SetLimit(RLIMIT_NOFILE, kMaxOpenFiles);
  SetLimit(RLIMIT_CORE, 0);
  SetLimit(RLIMIT_CPU, (kJobDeadlineMs + 999) / 1000 + 5);
  execve(argv[0], argv, envp);
err:
  {
    int err = errno;
    IGNORE_RETURN(write(kErrorFd, &err, sizeof(err)));
  }
  _exit(127);
}

// Returns the worker with the read side of its result channel, or pid -1
// with errno set
WorkerProcess SpawnWorker(const Job& job) {
  WorkerProcess ret;
  const std::vector<std::string> args = {
    WorkerPath(),
    "--policy", JobPolicyFile(job.id),
    "--memory-limit", std::to_string(kMaxMemoryMiB),
    "--max-source", std::to_string(kMaxSourceKiB),
    job.dir, JobSourceFile(job.id),
  };
  const std::vector<std::string> env = {
    "PATH=/usr/bin:/bin",
    "LANG=C.UTF-8",
    "TZ=UTC",
  };
  std::vector<char*> argv, envp;
  for (auto& i : args) argv.push_back(const_cast<char*>(i.c_str()));
  for (auto& i : env) envp.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  envp.push_back(nullptr);

  int channel[2] = {-1, -1}, error_pipe[2] = {-1, -1};
  int null_fd = -1, log_fd = -1, saved_errno = 0;
  pid_t pid;
  if (pipe2(channel, O_CLOEXEC) < 0 || pipe2(error_pipe, O_CLOEXEC) < 0) goto err;
  if ((null_fd = open("/dev/null", O_RDWR | O_CLOEXEC)) < 0) goto err;
  if ((log_fd = open(JobWorkerLog(job.id).c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600)) < 0) goto err;

  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) ExecWorker(null_fd, channel[1], log_fd, error_pipe[1], argv.data(), envp.data());
  // also set here so killpg works before the child gets to run
  setpgid(pid, pid);
  close(channel[1]);
  close(error_pipe[1]);
  close(null_fd);
  close(log_fd);
  {
    int err = 0;
    ssize_t n;
    while ((n = read(error_pipe[0], &err, sizeof(err))) < 0 && errno == EINTR);
    close(error_pipe[0]);
    if (n > 0) {
      waitpid(pid, nullptr, 0);
      close(channel[0]);
      errno = err;
      return ret;
    }
  }
  spdlog::debug("Started worker pid={} job={}", pid, job.id);
  ret.pid = pid;
  ret.channel_fd = channel[0];
  return ret;
err:
  saved_errno = errno;
  for (int fd : {channel[0], channel[1], error_pipe[0], error_pipe[1], null_fd, log_fd}) {
    if (fd >= 0) close(fd);
  }
  errno = saved_errno;
  return ret;
}

// Reaps pid if it exits before the deadline
bool WaitUntil(pid_t pid, Clock::time_point deadline, int& status) {
  while (true) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) return true;
    if (ret < 0 && errno != EINTR) {
      spdlog::warn("waitpid({}) failed: {}", pid, strerror(errno));
      return true;
    }
    if (Clock::now() >= deadline) return false;
    std::this_thread::sleep_for(kReapInterval);
  }
}

// SIGTERM to the whole group, then SIGKILL after the grace period
int Terminate(pid_t pid) {
  int status = 0;
  if (killpg(pid, SIGTERM) < 0) spdlog::warn("killpg({}, SIGTERM) failed: {}", pid, strerror(errno));
  auto grace = Clock::now() + std::chrono::milliseconds(kTerminateGraceMs);
  if (WaitUntil(pid, grace, status)) {
    spdlog::info("Worker {} exited after SIGTERM", pid);
    return status;
  }
  spdlog::warn("Worker {} ignored SIGTERM; killing", pid);
  killpg(pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  return status;
}

enum class ChannelState { EOF_REACHED, OVERFLOW, DEADLINE, FAILED };

ChannelState ReadChannel(int fd, Clock::time_point deadline, std::string& data) {
  struct pollfd pfd = {fd, POLLIN, 0};
  char buf[65536];
  while (true) {
    auto now = Clock::now();
    if (now >= deadline) return ChannelState::DEADLINE;
    long ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
    int ret = poll(&pfd, 1, (int)std::min(ms, 60000L));
    if (ret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll on result channel failed: {}", strerror(errno));
      return ChannelState::FAILED;
    }
    if (ret == 0) continue;
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      spdlog::warn("read on result channel failed: {}", strerror(errno));
      return ChannelState::FAILED;
    }
    if (n == 0) return ChannelState::EOF_REACHED;
    if (data.size() + n > kMaxChannelBytes) {
      data.append(buf, kMaxChannelBytes - data.size());
      return ChannelState::OVERFLOW;
    }
    data.append(buf, n);
  }
}

std::string DescribeExit(int status) {
  if (WIFEXITED(status)) return "worker exited with status " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) {
    return std::string("worker killed by signal ") + strsignal(WTERMSIG(status));
  }
  return "worker ended abnormally";
}

// Drops anything a worker should not have reported
std::vector<std::string> ValidateFiles(const Policy& policy, const Job& job,
                                       const std::vector<std::string>& files) {
  std::vector<std::string> ret;
  for (auto& i : files) {
    fs::path path(i);
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!path.is_absolute() || path.lexically_normal() != path ||
        path.parent_path() != job.dir || !policy.IsPermittedOutput(path.filename()) ||
        ec || !fs::is_regular_file(status)) {
      spdlog::warn("Job {}: dropping reported file {}", job.id, Utf8Prefix(i, 256));
      continue;
    }
    ret.push_back(i);
  }
  return ret;
}

ExecutionResult Execute(const Policy& policy, Job& job) {
  if (job.source.size() > (size_t)kMaxSourceKiB << 10) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::SETUP,
        "script source exceeds " + std::to_string(kMaxSourceKiB) + " KiB"));
  }
  if (!MakeJobDir(job)) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER, "cannot create job directory"));
  }
  if (!WriteFile(JobSourceFile(job.id), job.source) ||
      !WriteFile(JobPolicyFile(job.id), policy.ToJson().dump())) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER, "cannot stage job inputs"));
  }

  job.deadline = Clock::now() + std::chrono::milliseconds(kJobDeadlineMs);
  WorkerProcess worker = SpawnWorker(job);
  if (worker.pid < 0) {
    spdlog::error("Job {}: cannot start worker {}: {}", job.id, WorkerPath().c_str(), strerror(errno));
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER,
        std::string("cannot start worker: ") + strerror(errno)));
  }
  job.worker_pid = worker.pid;

  std::string data;
  ChannelState state = ReadChannel(worker.channel_fd, job.deadline, data);
  close(worker.channel_fd);
  int status = 0;
  switch (state) {
    case ChannelState::EOF_REACHED:
      // the worker may still be flushing logs after closing the channel
      if (!WaitUntil(worker.pid, job.deadline, status)) {
        spdlog::warn("Job {}: worker still running after reporting", job.id);
        status = Terminate(worker.pid);
      }
      break;
    case ChannelState::DEADLINE:
      spdlog::info("Job {}: deadline of {} ms reached", job.id, kJobDeadlineMs);
      job.wait_status = Terminate(worker.pid);
      return ExecutionResult::Timeout(MakeDiagnostic(DiagnosticKind::TIMEOUT,
          fmt::format("script exceeded the {:g} second time limit", kJobDeadlineMs / 1000.0)));
    case ChannelState::OVERFLOW:
    case ChannelState::FAILED:
      killpg(worker.pid, SIGKILL);
      while (waitpid(worker.pid, &status, 0) < 0 && errno == EINTR);
      break;
  }
  job.wait_status = status;
  spdlog::debug("Job {}: {}", job.id, DescribeExit(status));

  if (state == ChannelState::OVERFLOW) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::PROTOCOL,
        "result exceeds " + std::to_string(kMaxChannelBytes) + " bytes"));
  }
  if (data.empty()) {
    std::string log = ReadFileTail(JobWorkerLog(job.id), 2048);
    if (log.size()) spdlog::warn("Job {}: worker log tail:\n{}", job.id, log);
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER, DescribeExit(status)));
  }
  auto result = DecodeResult(data);
  if (!result) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::PROTOCOL,
        "unparseable result: " + BoundedExcerpt(data, 200)));
  }
  // only the orchestrator's deadline produces a timeout
  if (result->status == Outcome::TIMEOUT) {
    return ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::PROTOCOL,
        "worker reported a timeout: " + BoundedExcerpt(result->message, 200)));
  }
  if (result->status == Outcome::SUCCESS) result->files = ValidateFiles(policy, job, result->files);
  return *result;
}

bool IsEmptyDir(const fs::path& dir) {
  std::error_code ec;
  return fs::is_empty(dir, ec) && !ec;
}

} // namespace

std::string SanitizeCallerId(const std::string& caller_id) {
  std::string ret;
  for (char c : caller_id) {
    if (ret.size() >= kMaxCallerIdLength) break;
    if (isalnum((unsigned char)c) || c == '_' || c == '-') ret.push_back(c);
  }
  return ret.empty() ? "anon" : ret;
}

ExecutionResult RunJob(const Policy& policy, Job& job) {
  job.created = std::chrono::system_clock::now();
  try {
    job.result = Execute(policy, job);
  } catch (std::exception& e) {
    spdlog::error("Job {} failed: {}", job.id, e.what());
    job.result = ExecutionResult::Error(MakeDiagnostic(DiagnosticKind::WORKER, e.what()));
  }
  if (job.id.size()) {
    IGNORE_RETURN(RemoveAll(JobStagingPath(job.id)));
    if (IsEmptyDir(job.dir)) {
      CleanupJobDir(job.dir);
    } else {
      ScheduleCleanup(job.dir, std::chrono::seconds(kRetentionSec));
    }
  }
  spdlog::info("Job {} finished: {}", job.id, OutcomeName(job.result.status));
  return job.result;
}

ExecutionResult RunJob(const Policy& policy, const std::string& source, const std::string& caller_id) {
  Job job;
  job.source = source;
  job.caller_id = caller_id;
  return RunJob(policy, job);
}

std::future<ExecutionResult> SubmitJob(const Policy& policy, std::string source, std::string caller_id) {
  return std::async(std::launch::async,
      [policy, source = std::move(source), caller_id = std::move(caller_id)]() {
        return RunJob(policy, source, caller_id);
      });
}
