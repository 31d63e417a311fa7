#pragma once

#include "registry.hpp"

namespace trailbot::bots {

void register_core_plugins(BotRegistry& registry);

}  // namespace trailbot::bots
