#include "server.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>
#include <charconv>
#include <chrono>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "world.hpp"

namespace trailbot::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

struct Target {
  std::string path;
  std::unordered_map<std::string, std::string> query;
};

Target split_target(const std::string& raw) {
  Target target;
  auto mark = raw.find('?');
  target.path = raw.substr(0, mark);
  if (mark == std::string::npos) {
    return target;
  }
  std::string query = raw.substr(mark + 1);
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string::npos) {
        target.query[pair] = "";
      } else {
        target.query[pair.substr(0, eq)] = pair.substr(eq + 1);
      }
    }
    start = end + 1;
  }
  return target;
}

std::optional<int> parse_int(const std::string& text) {
  int value = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

ApiResponse json_response(unsigned status, const boost::json::object& payload) {
  ApiResponse res;
  res.status = status;
  res.body = boost::json::serialize(payload);
  return res;
}

ApiResponse status_response(unsigned status, const char* key, const std::string& message) {
  boost::json::object payload;
  payload[key] = message;
  return json_response(status, payload);
}

bool is_blank(const std::string& body) {
  return body.find_first_not_of(" \t\r\n") == std::string::npos;
}

ApiResponse handle_send_state(bots::MatchManager& manager, const std::string& body) {
  auto parsed = parse_state_sync(body);
  if (!parsed.sync) {
    spdlog::warn("rejected state sync: {}", parsed.error);
    return status_response(400, "error", parsed.error);
  }
  manager.sync(*parsed.sync);
  return status_response(200, "status", "state received");
}

ApiResponse handle_send_move(bots::MatchManager& manager, const Target& target) {
  std::optional<int> raw_player;
  auto it = target.query.find("player_number");
  if (it != target.query.end()) {
    raw_player = parse_int(it->second);
  }
  int player = bots::player_number_from(raw_player);
  bots::MoveDecision decision = manager.decide(player);
  return status_response(200, "move", decision.wire());
}

ApiResponse handle_end(bots::MatchManager& manager, const std::string& body) {
  std::optional<StateSync> final_update;
  if (!is_blank(body)) {
    auto parsed = parse_state_sync(body);
    if (parsed.sync) {
      final_update = std::move(parsed.sync);
    } else {
      spdlog::warn("ignoring final state on match end: {}", parsed.error);
    }
  }
  manager.end_match(final_update);
  return status_response(200, "status", "acknowledged");
}

ApiResponse handle_info() {
  const auto& cfg = config::get();
  boost::json::object payload;
  payload["participant"] = cfg.participant;
  payload["agent_name"] = cfg.agent_name;
  return json_response(200, payload);
}

}  // namespace

ServerConfig ServerConfig::from_config() {
  const auto& cfg = config::get();
  ServerConfig out;
  out.host = cfg.host;
  out.port = cfg.port;
  out.threads = cfg.threads;
  return out;
}

ApiResponse handle_api(bots::MatchManager& manager,
                       const std::string& method,
                       const std::string& raw_target,
                       const std::string& body) {
  Target target = split_target(raw_target);
  bool is_get = method == "GET";
  bool is_post = method == "POST";

  if (target.path == "/") {
    return is_get ? handle_info() : status_response(405, "error", "method not allowed");
  }
  if (target.path == "/send-move") {
    return is_get ? handle_send_move(manager, target) : status_response(405, "error", "method not allowed");
  }
  if (target.path == "/send-state") {
    return is_post ? handle_send_state(manager, body) : status_response(405, "error", "method not allowed");
  }
  if (target.path == "/end") {
    return is_post ? handle_end(manager, body) : status_response(405, "error", "method not allowed");
  }
  if (target.path == "/api/session") {
    return is_get ? json_response(200, manager.describe()) : status_response(405, "error", "method not allowed");
  }
  return status_response(404, "error", "not found");
}

namespace {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<bots::MatchManager> manager)
      : stream_(std::move(socket)),
        manager_(std::move(manager)) {}

  void run() {
    do_read();
  }

 private:
  void do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                       self->on_read(ec, bytes);
                     });
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      return do_close();
    }
    if (ec) {
      if (ec != beast::error::timeout) {
        spdlog::debug("read failed: {}", ec.message());
      }
      return;
    }

    ApiResponse api = handle_api(*manager_, std::string(req_.method_string()), std::string(req_.target()), req_.body());
    spdlog::debug("{} {} -> {}", std::string(req_.method_string()), std::string(req_.target()), api.status);
    send_response(api);
  }

  void send_response(const ApiResponse& api) {
    auto res = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(api.status),
                                                                   req_.version());
    res->set(http::field::server, "trailbot");
    res->set(http::field::content_type, api.content_type);
    res->keep_alive(req_.keep_alive());
    res->body() = api.body;
    res->prepare_payload();
    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                        if (ec) {
                          spdlog::debug("write failed: {}", ec.message());
                          return;
                        }
                        if (!self->req_.keep_alive()) {
                          self->do_close();
                        } else {
                          self->do_read();
                        }
                      });
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<bots::MatchManager> manager_;
};

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<bots::MatchManager> manager)
      : acceptor_(ioc),
        socket_(ioc),
        manager_(std::move(manager)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    error_ = ec;
  }

  const beast::error_code& error() const {
    return error_;
  }

  void run() {
    do_accept();
  }

 private:
  void do_accept() {
    acceptor_.async_accept(socket_, [self = shared_from_this()](beast::error_code ec) {
      if (!ec) {
        std::make_shared<HttpSession>(std::move(self->socket_), self->manager_)->run();
      } else {
        spdlog::warn("accept failed: {}", ec.message());
      }
      self->do_accept();
    });
  }

  tcp::acceptor acceptor_;
  tcp::socket socket_;
  std::shared_ptr<bots::MatchManager> manager_;
  beast::error_code error_;
};

}  // namespace

int run(const ServerConfig& config) {
  const auto& cfg = config::get();
  auto manager = bots::MatchManager::from_config();
  spdlog::info("{} ({}) playing policy '{}' on a {}x{} board", cfg.agent_name, cfg.participant, cfg.policy,
               cfg.board_width, cfg.board_height);

  net::io_context ioc{config.threads};
  beast::error_code ec;
  auto address = net::ip::make_address(config.host, ec);
  if (ec) {
    spdlog::error("invalid host '{}': {}", config.host, ec.message());
    return 1;
  }
  tcp::endpoint endpoint{address, static_cast<unsigned short>(config.port)};
  auto listener = std::make_shared<Listener>(ioc, endpoint, manager);
  if (listener->error()) {
    spdlog::error("cannot listen on {}:{}: {}", config.host, config.port, listener->error().message());
    return 1;
  }
  listener->run();
  spdlog::info("listening on {}:{} with {} thread(s)", config.host, config.port, config.threads);

  std::vector<std::thread> threads;
  threads.reserve(static_cast<std::size_t>(config.threads > 0 ? config.threads - 1 : 0));
  for (int i = 1; i < config.threads; ++i) {
    threads.emplace_back([&ioc]() { ioc.run(); });
  }
  ioc.run();
  for (auto& t : threads) {
    t.join();
  }
  return 0;
}

}  // namespace trailbot::server
