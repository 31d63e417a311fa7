#pragma once

#include <optional>
#include <spdlog/common.h>
#include <string>

namespace trailbot::config {

struct Config {
  std::string host = "0.0.0.0";
  int port = 5008;
  int threads = 1;

  int board_width = 20;
  int board_height = 18;
  int start_boosts = 3;

  std::string policy = "corridor";
  int panic_threshold = 1;
  int boost_space_threshold = 10;
  bool corridor_boost = false;

  std::string participant = "trailbot";
  std::string agent_name = "CorridorRunner";
  std::string log_level = "info";
};

Config load_from_env();
const Config& get();

// nullopt for names spdlog does not know, instead of its silent "off".
std::optional<spdlog::level::level_enum> log_level_from(const std::string& name);

}  // namespace trailbot::config
