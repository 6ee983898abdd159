#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "logging.hpp"
#include "server.hpp"

namespace {

constexpr const char* kUsage =
    "Usage: soulwar_server [--host HOST] [--port PORT] [--static-dir PATH] [--threads N]\n"
    "Simulation settings are read from SOULWAR_* environment variables.\n";

// Returns nullopt after printing usage, either on --help or on a bad flag.
// exit_code tells the two apart.
std::optional<soulwar::server::ServerConfig> parse_args(int argc, char** argv, int& exit_code) {
  soulwar::server::ServerConfig listen;
  exit_code = 0;
  for (int i = 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--help" || flag == "-h") {
      std::cout << kUsage;
      return std::nullopt;
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n" << kUsage;
      exit_code = 2;
      return std::nullopt;
    }
    std::string value = argv[++i];
    if (flag == "--host") {
      listen.host = value;
    } else if (flag == "--port") {
      listen.port = std::atoi(value.c_str());
      if (listen.port <= 0 || listen.port > 65535) {
        std::cerr << "port out of range: " << value << "\n";
        exit_code = 2;
        return std::nullopt;
      }
    } else if (flag == "--static-dir") {
      listen.static_dir = value;
    } else if (flag == "--threads") {
      listen.threads = std::max(1, std::atoi(value.c_str()));
    } else {
      std::cerr << "unknown option " << flag << "\n" << kUsage;
      exit_code = 2;
      return std::nullopt;
    }
  }
  return listen;
}

}  // namespace

int main(int argc, char** argv) {
  int exit_code = 0;
  std::optional<soulwar::server::ServerConfig> listen = parse_args(argc, argv, exit_code);
  if (!listen) {
    return exit_code;
  }

  soulwar::config::Config game = soulwar::config::load_from_env();
  try {
    soulwar::logging::init(game.log_level, game.log_file);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "log setup failed: " << ex.what() << "\n";
    return 1;
  }

  try {
    soulwar::config::validate(game);
  } catch (const std::invalid_argument& ex) {
    spdlog::critical("invalid configuration: {}", ex.what());
    return 1;
  }

  return soulwar::server::run(*listen, game);
}
