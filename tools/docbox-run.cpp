#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <docbox/job.h>
#include <docbox/config.h>
#include <docbox/logger.h>

#include "docbox/protocol.h"

// Runs one script through the same orchestrator docboxd uses and prints the
// result message. Output files are removed at exit.
int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "docbox-run");
  parser.add_argument("script")
    .help("Script to run");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-u", "--caller")
    .default_value(std::string("cli"))
    .help("Caller id the job directory is named after");
  parser.add_argument("-k", "--keep")
    .default_value(false)
    .implicit_value(true)
    .help("Leave the output files in place");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  Policy policy = Policy::Default();
  if (auto config = parser.present("--config"); config && !ParseConfig(*config, policy)) {
    spdlog::error("Failed to parse configuration file {}", *config);
    return 1;
  }
  std::string script = parser.get<std::string>("script");
  std::ifstream fin(script, std::ios::binary);
  if (!fin) {
    spdlog::error("Cannot read {}", script);
    return 1;
  }
  std::stringstream source;
  source << fin.rdbuf();

  ExecutionResult result = RunJob(policy, source.str(), parser.get<std::string>("--caller"));
  std::cout << ResultToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
  if (parser["--keep"] == false) FlushCleanup();
  switch (result.status) {
    case Outcome::SUCCESS: return 0;
    case Outcome::ERROR: return 1;
    case Outcome::TIMEOUT: return 2;
  }
  __builtin_unreachable();
}
