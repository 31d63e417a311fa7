#include "server.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>

#include "config.hpp"

namespace {

void print_usage() {
  std::cout << "Usage: trailbot [--host HOST] [--port PORT] [--threads N] [--policy NAME]"
               " [--board WxH] [--panic-threshold N] [--boost-threshold N] [--log-level LEVEL]\n";
}

void set_env(const char* key, const std::string& value) {
  setenv(key, value.c_str(), 1);
}

}  // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--host" && i + 1 < argc) {
      set_env("TRAILBOT_HOST", argv[++i]);
      continue;
    }
    if (arg == "--port" && i + 1 < argc) {
      set_env("PORT", argv[++i]);
      continue;
    }
    if (arg == "--threads" && i + 1 < argc) {
      set_env("TRAILBOT_THREADS", argv[++i]);
      continue;
    }
    if (arg == "--policy" && i + 1 < argc) {
      set_env("TRAILBOT_POLICY", argv[++i]);
      continue;
    }
    if (arg == "--board" && i + 1 < argc) {
      std::string size = argv[++i];
      auto sep = size.find('x');
      if (sep == std::string::npos) {
        std::cerr << "--board expects WxH, got '" << size << "'\n";
        return 2;
      }
      set_env("TRAILBOT_BOARD_WIDTH", size.substr(0, sep));
      set_env("TRAILBOT_BOARD_HEIGHT", size.substr(sep + 1));
      continue;
    }
    if (arg == "--panic-threshold" && i + 1 < argc) {
      set_env("TRAILBOT_PANIC_THRESHOLD", argv[++i]);
      continue;
    }
    if (arg == "--boost-threshold" && i + 1 < argc) {
      set_env("TRAILBOT_BOOST_SPACE_THRESHOLD", argv[++i]);
      continue;
    }
    if (arg == "--log-level" && i + 1 < argc) {
      set_env("TRAILBOT_LOG_LEVEL", argv[++i]);
      continue;
    }
    std::cerr << "Unknown argument '" << arg << "'\n";
    print_usage();
    return 2;
  }

  const auto& cfg = trailbot::config::get();
  auto level = trailbot::config::log_level_from(cfg.log_level);
  if (!level) {
    std::cerr << "Unknown log level '" << cfg.log_level << "'\n";
    print_usage();
    return 2;
  }
  spdlog::set_level(*level);

  try {
    return trailbot::server::run(trailbot::server::ServerConfig::from_config());
  } catch (const std::exception& e) {
    spdlog::critical("startup failed: {}", e.what());
    return 1;
  }
}
