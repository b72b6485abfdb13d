#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <algorithm>
#include <iostream>
#include <exception>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <argparse/argparse.hpp>
#include <docbox/job.h>

#include "docbox/protocol.h"
#include "docbox/worker.h"
#include "docbox/utils.h"

namespace {

volatile sig_atomic_t terminate_requested = 0;
ResultChannel* channel = nullptr;

void OnTerminateSignal(int) {
  terminate_requested = 1;
}

[[noreturn]] void OnUnhandled() {
  if (channel) channel->ReportFallback();
  _exit(1);
}

bool SetupSignals() {
  struct sigaction sa{};
  sa.sa_handler = OnTerminateSignal;
  sigemptyset(&sa.sa_mask);
  if (sigaction(SIGTERM, &sa, nullptr) < 0) return false;
  // writes past RLIMIT_FSIZE fail with EFBIG instead of killing the worker
  if (signal(SIGXFSZ, SIG_IGN) == SIG_ERR) return false;
  if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) return false;
  return true;
}

// Moves the result channel off fd 1 so nothing but the channel can write on it
int TakeChannel() {
  int fd = fcntl(1, F_DUPFD_CLOEXEC, 3);
  if (fd < 0) return -1;
  int null_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (null_fd < 0 || dup2(null_fd, 1) < 0) {
    close(fd);
    return -1;
  }
  close(null_fd);
  return fd;
}

bool LoadPolicy(const fs::path& path, Policy& policy) {
  std::string data;
  if (!ReadFile(path, 1 << 20, data)) return false;
  auto json = nlohmann::json::parse(data, nullptr, false);
  if (json.is_discarded()) {
    spdlog::error("Policy file {} is not valid JSON", path.c_str());
    return false;
  }
  try {
    policy = Policy::FromJson(json);
  } catch (std::invalid_argument& e) {
    spdlog::error("Invalid policy file {}: {}", path.c_str(), e.what());
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_st("worker"));
  spdlog::set_pattern("[%P] %+");
  spdlog::set_level(spdlog::level::warn);

  int channel_fd = TakeChannel();
  if (channel_fd < 0) {
    spdlog::error("Cannot set up the result channel: {}", strerror(errno));
    return 1;
  }
  static ResultChannel result_channel(channel_fd);
  channel = &result_channel;
  std::set_terminate(OnUnhandled);
  if (!SetupSignals()) {
    spdlog::error("Cannot install signal handlers: {}", strerror(errno));
    result_channel.Report(ExecutionResult::Error(
        MakeDiagnostic(DiagnosticKind::SETUP, "cannot install signal handlers")));
    return 1;
  }

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "docbox-worker");
  parser.add_argument("job_dir")
    .help("Directory the script may write its output files to");
  parser.add_argument("source_file")
    .help("Script source");
  parser.add_argument("--policy")
    .help("Policy file (JSON); the built-in default if absent");
  parser.add_argument("--memory-limit")
    .scan<'d', long>()
    .default_value(kMaxMemoryMiB)
    .help("Interpreter memory limit in MiB; 0 for unlimited");
  parser.add_argument("--max-source")
    .scan<'d', long>()
    .default_value(kMaxSourceKiB)
    .help("Largest accepted script source in KiB");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    result_channel.Report(ExecutionResult::Error(
        MakeDiagnostic(DiagnosticKind::SETUP, std::string("bad worker invocation: ") + err.what())));
    return 2;
  }
  switch (verbosity) {
    case 0: break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  Policy policy = Policy::Default();
  if (auto path = parser.present("--policy"); path && !LoadPolicy(*path, policy)) {
    result_channel.Report(ExecutionResult::Error(
        MakeDiagnostic(DiagnosticKind::SETUP, "cannot load the policy")));
    return 1;
  }
  long memory_mib = parser.get<long>("--memory-limit");
  if (memory_mib < 0) memory_mib = 0;

  WorkerOptions opts;
  opts.job_dir = parser.get<std::string>("job_dir");
  opts.source_file = parser.get<std::string>("source_file");
  opts.memory_limit = (size_t)memory_mib << 20;
  opts.max_source_size = (size_t)std::max(parser.get<long>("--max-source"), 0L) << 10;

  Worker worker(policy, std::move(opts), &terminate_requested);
  ExecutionResult result = worker.Run(result_channel);
  close(channel_fd);
  return result.status == Outcome::SUCCESS ? 0 : 1;
}
