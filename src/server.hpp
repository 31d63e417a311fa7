#pragma once

#include <string>

#include "bots/manager.hpp"

namespace trailbot::server {

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 5008;
  int threads = 1;

  static ServerConfig from_config();
};

struct ApiResponse {
  unsigned status = 200;
  std::string body;
  std::string content_type = "application/json";
};

// Routes one game-master request onto the match manager. Transport-free so
// the HTTP session and the tests share it.
ApiResponse handle_api(bots::MatchManager& manager,
                       const std::string& method,
                       const std::string& target,
                       const std::string& body);

int run(const ServerConfig& config);

}  // namespace trailbot::server
