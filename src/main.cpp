#include <pthread.h>
#include <csignal>
#include <thread>
#include <iostream>
#include <filesystem>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <docbox/job.h>
#include <docbox/config.h>
#include <docbox/logger.h>
#include <docbox/paths.h>
#include "server.h"

namespace {

Policy ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "docboxd");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/docbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel jobs");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--no-config")
    .default_value(false)
    .implicit_value(true)
    .help("Use the built-in defaults without reading a configuration file");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  Policy policy = Policy::Default();
  if (parser["--no-config"] == false) {
    fs::path config_file = parser.get<std::string>("--config");
    if (!ParseConfig(config_file, policy)) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present("--host")) {
    kListenHost = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kListenPort = val.value();
  }
  return policy;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Policy policy = ParseArgs(argc, argv);

  // every thread inherits the mask; shutdown signals are taken by sigwait below
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
  signal(SIGPIPE, SIG_IGN);

  httplib::Server svr;
  SetupRoutes(svr, policy);
  if (!svr.bind_to_port(kListenHost, kListenPort)) {
    spdlog::error("Cannot listen on {}:{}", kListenHost, kListenPort);
    return 1;
  }
  spdlog::warn("docboxd listening on {}:{}, job root {}, worker {}",
               kListenHost, kListenPort, kJobRoot.c_str(), WorkerPath().c_str());
  std::thread server_thread([&svr]() { svr.listen_after_bind(); });

  int sig = 0;
  sigwait(&shutdown_signals, &sig);
  spdlog::warn("Received signal {}; shutting down", sig);
  svr.stop();
  server_thread.join();
  // no job is running once the server has stopped
  FlushCleanup();
  return 0;
}
