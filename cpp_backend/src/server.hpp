#pragma once

#include <string>

#include "config.hpp"

namespace soulwar::server {

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8099;
  std::string static_dir = "static";
  int threads = 1;
};

// Serves observers over HTTP and WebSocket and drives the simulation tick.
// Blocks until the io_context stops. Returns non-zero when the listener
// cannot be set up.
int run(const ServerConfig& config, const config::Config& game);

}  // namespace soulwar::server
