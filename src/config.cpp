#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace trailbot::config {
namespace {

std::string trim_lower(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
    return !std::isspace(ch);
  }));
  value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
    return !std::isspace(ch);
  }).base(), value.end());
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

bool env_bool(const char* name, bool fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return fallback;
  }
  std::string value = trim_lower(raw);
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

int env_int(const char* name, int fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return fallback;
  }
  try {
    return std::stoi(raw);
  } catch (const std::exception&) {
    return fallback;
  }
}

std::string env_string(const char* name, const char* fallback) {
  const char* raw = std::getenv(name);
  if (!raw || raw[0] == '\0') {
    return std::string(fallback ? fallback : "");
  }
  return std::string(raw);
}

}  // namespace

Config load_from_env() {
  Config cfg;
  cfg.host = env_string("TRAILBOT_HOST", "0.0.0.0");
  cfg.port = env_int("PORT", 5008);
  cfg.threads = std::max(1, env_int("TRAILBOT_THREADS", 1));

  cfg.board_width = std::max(1, env_int("TRAILBOT_BOARD_WIDTH", 20));
  cfg.board_height = std::max(1, env_int("TRAILBOT_BOARD_HEIGHT", 18));
  cfg.start_boosts = std::max(0, env_int("TRAILBOT_START_BOOSTS", 3));

  cfg.policy = trim_lower(env_string("TRAILBOT_POLICY", "corridor"));
  cfg.panic_threshold = std::max(0, env_int("TRAILBOT_PANIC_THRESHOLD", 1));
  cfg.boost_space_threshold = env_int("TRAILBOT_BOOST_SPACE_THRESHOLD", 10);
  cfg.corridor_boost = env_bool("TRAILBOT_CORRIDOR_BOOST", false);

  cfg.participant = env_string("TRAILBOT_PARTICIPANT", "trailbot");
  cfg.agent_name = env_string("TRAILBOT_AGENT_NAME", "CorridorRunner");
  cfg.log_level = trim_lower(env_string("TRAILBOT_LOG_LEVEL", "info"));
  return cfg;
}

const Config& get() {
  static Config cfg = load_from_env();
  return cfg;
}

std::optional<spdlog::level::level_enum> log_level_from(const std::string& name) {
  std::string key = trim_lower(name);
  auto level = spdlog::level::from_str(key);
  if (level == spdlog::level::off && key != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace trailbot::config
