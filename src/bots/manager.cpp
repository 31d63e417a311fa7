#include "manager.hpp"

#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace trailbot::bots {

int player_number_from(const std::optional<int>& raw) {
  if (!raw) {
    return 1;
  }
  return *raw == 1 ? 1 : 2;
}

MatchManager::MatchManager(GameState initial_state, const std::string& policy_name, BrainSettings settings)
    : state_(std::move(initial_state)),
      policy_name_(policy_name),
      settings_(settings) {
  register_core_plugins(registry_);
  BotInitContext init_ctx;
  init_ctx.policy_name = policy_name;
  init_ctx.settings = settings;
  brain_ = registry_.create(policy_name, init_ctx);
  sessions_ = {MatchSession{}, MatchSession{}};
}

std::shared_ptr<MatchManager> MatchManager::from_config() {
  const auto& cfg = config::get();
  BrainSettings settings;
  settings.panic_threshold = cfg.panic_threshold;
  settings.boost_space_threshold = cfg.boost_space_threshold;
  settings.corridor_boost = cfg.corridor_boost;
  return std::make_shared<MatchManager>(GameState::from_config(), cfg.policy, settings);
}

std::size_t MatchManager::role_index(int player_number) {
  return player_number == 1 ? 0 : 1;
}

void MatchManager::sync(const StateSync& update) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.apply(update);
}

MoveDecision MatchManager::decide(int player_number) {
  std::size_t role = role_index(player_number);
  int player = static_cast<int>(role) + 1;

  std::optional<GameState> snapshot;
  DecisionContext ctx;
  std::uint64_t epoch = 0;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    snapshot.emplace(state_);
    ctx.session = sessions_[role];
    epoch = match_epoch_;
  }
  ctx.state = &*snapshot;
  ctx.player_number = player;
  ctx.me = &snapshot->agent(player);
  ctx.opponent = &snapshot->opponent_of(player);

  MatchSession before = ctx.session;
  MoveDecision decision;
  try {
    decision = brain_->decide(ctx);
  } catch (const std::exception& e) {
    spdlog::error("policy '{}' failed for player {}: {}", policy_name_, player, e.what());
    ctx.session = before;
    decision = MoveDecision{ctx.me->heading, false, -1};
  }
  ctx.session.decisions += 1;

  if (ctx.session.phase != before.phase) {
    spdlog::info("player {}: {} -> {} on turn {}", player, to_string(before.phase), to_string(ctx.session.phase),
                 snapshot->turns);
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (epoch == match_epoch_) {
      sessions_[role] = ctx.session;
    } else {
      spdlog::debug("player {}: match reset during decision, dropping session update", player);
    }
  }
  return decision;
}

void MatchManager::end_match(const std::optional<StateSync>& final_update) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (final_update) {
    state_.apply(*final_update);
  }
  sessions_ = {MatchSession{}, MatchSession{}};
  ++match_epoch_;
  spdlog::info("match {} ended after turn {}", match_epoch_, state_.turns);
}

MatchSession MatchManager::session(int player_number) const {
  std::lock_guard<std::mutex> guard(mutex_);
  return sessions_[role_index(player_number)];
}

GameState MatchManager::snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

boost::json::object MatchManager::describe() const {
  std::lock_guard<std::mutex> guard(mutex_);
  boost::json::object payload;
  payload["policy"] = policy_name_;

  boost::json::array registered;
  for (const auto& [key, entry] : registry_.entries()) {
    boost::json::object row;
    row["name"] = entry.name;
    row["summary"] = entry.summary;
    registered.push_back(std::move(row));
  }
  payload["registeredPolicies"] = std::move(registered);

  boost::json::object settings;
  settings["panicThreshold"] = settings_.panic_threshold;
  settings["boostSpaceThreshold"] = settings_.boost_space_threshold;
  settings["corridorBoost"] = settings_.corridor_boost;
  payload["settings"] = std::move(settings);
  payload["matchesCompleted"] = match_epoch_;
  payload["state"] = state_.describe();

  boost::json::array sessions;
  for (std::size_t i = 0; i < sessions_.size(); ++i) {
    const MatchSession& session = sessions_[i];
    boost::json::object row;
    row["player"] = static_cast<int>(i) + 1;
    row["phase"] = to_string(session.phase);
    row["escapeBias"] = session.escape_bias;
    row["decisions"] = session.decisions;
    if (session.corridor) {
      boost::json::object corridor;
      corridor["safeRow"] = session.corridor->safe_row;
      corridor["exitColumn"] = session.corridor->exit_column;
      row["corridor"] = std::move(corridor);
    } else {
      row["corridor"] = nullptr;
    }
    sessions.push_back(std::move(row));
  }
  payload["sessions"] = std::move(sessions);
  return payload;
}

}  // namespace trailbot::bots
