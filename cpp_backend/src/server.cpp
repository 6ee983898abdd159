#include "server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "clock.hpp"
#include "protocol.hpp"
#include "world.hpp"

namespace soulwar::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace fs = std::filesystem;
using tcp = net::ip::tcp;

// One serialized message, shared by every observer it is sent to.
using Payload = std::shared_ptr<const std::string>;
using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

constexpr const char* kServerName = "soulwar";
constexpr const char* kObserverPath = "/ws";
constexpr const char* kStaticPrefix = "/static/";
constexpr std::size_t kOutboxLimit = 1024;
constexpr std::chrono::seconds kRequestTimeout{30};

Payload encode(const boost::json::object& message) {
  return std::make_shared<const std::string>(boost::json::serialize(message));
}

std::string content_type_for(const fs::path& file) {
  static const std::unordered_map<std::string, std::string> types = {
      {".html", "text/html"},
      {".htm", "text/html"},
      {".css", "text/css"},
      {".js", "application/javascript"},
      {".json", "application/json"},
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".svg", "image/svg+xml"},
      {".ico", "image/x-icon"},
  };
  auto it = types.find(file.extension().string());
  return it == types.end() ? "application/octet-stream" : it->second;
}

// Maps a request-relative path onto the static root. Empty when the result
// would land outside it.
std::optional<fs::path> resolve_static(const fs::path& root, const std::string& relative) {
  std::error_code ec;
  fs::path base = fs::weakly_canonical(root, ec);
  if (ec) {
    return std::nullopt;
  }
  fs::path file = fs::weakly_canonical(base / relative, ec);
  if (ec) {
    return std::nullopt;
  }
  auto diverge = std::mismatch(base.begin(), base.end(), file.begin(), file.end());
  if (diverge.first != base.end()) {
    return std::nullopt;
  }
  return file;
}

std::optional<std::string> load_file(const fs::path& file) {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return std::nullopt;
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Response make_response(const Request& req, http::status status, std::string body, const std::string& type) {
  Response res{status, req.version()};
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, type);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

Response plain(const Request& req, http::status status) {
  return make_response(req, status, std::string(http::obsolete_reason(status)), "text/plain");
}

class ObserverSession;

// Owns the world and the tick timer. The world is only touched under
// mutex_; observers receive serialized payloads.
class Simulation : public std::enable_shared_from_this<Simulation> {
 public:
  struct Attachment {
    int observer_id;
    Payload greeting;
  };

  Simulation(net::io_context& ioc, const config::Config& cfg)
      : timer_(ioc),
        cfg_(cfg),
        interval_(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / cfg.tick_rate))),
        world_(cfg, clock_) {}

  void start();
  void stop();

  Attachment attach(const std::shared_ptr<ObserverSession>& session);
  void detach(int observer_id);

  std::string world_json();
  std::string status_json();

 private:
  void arm(std::chrono::steady_clock::duration delay);
  void step();
  std::vector<std::shared_ptr<ObserverSession>> audience();

  net::steady_timer timer_;
  const config::Config& cfg_;
  std::chrono::steady_clock::duration interval_;
  SteadyClock clock_;
  GameWorld world_;
  std::mutex mutex_;
  std::map<int, std::weak_ptr<ObserverSession>> observers_;
  int next_observer_id_ = 1;
  double last_sync_at_ = 0.0;
  bool running_ = false;
};

// A read-only WebSocket viewer. The stream's executor is a strand, so every
// handler below runs serialized without explicit binding.
class ObserverSession : public std::enable_shared_from_this<ObserverSession> {
 public:
  ObserverSession(tcp::socket&& socket, std::shared_ptr<Simulation> simulation)
      : ws_(std::move(socket)),
        simulation_(std::move(simulation)) {}

  void accept(Request req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));
    ws_.async_accept(req, beast::bind_front_handler(&ObserverSession::on_accept, shared_from_this()));
  }

  // Thread-safe; called from the tick.
  void deliver(const std::vector<Payload>& batch) {
    net::post(ws_.get_executor(), [self = shared_from_this(), batch]() {
      for (const Payload& payload : batch) {
        self->enqueue(payload);
      }
    });
  }

 private:
  void on_accept(beast::error_code ec) {
    if (ec) {
      spdlog::warn("observer handshake failed: {}", ec.message());
      return;
    }
    Simulation::Attachment attachment = simulation_->attach(shared_from_this());
    observer_id_ = attachment.observer_id;
    enqueue(attachment.greeting);
    read_next();
  }

  void read_next() {
    ws_.async_read(inbox_, beast::bind_front_handler(&ObserverSession::on_message, shared_from_this()));
  }

  void on_message(beast::error_code ec, std::size_t) {
    if (ec) {
      return finish(ec);
    }
    std::string text = beast::buffers_to_string(inbox_.data());
    inbox_.consume(inbox_.size());
    // Observers cannot steer the simulation; only pings get an answer.
    if (protocol::message_type(text) == "ping") {
      enqueue(encode(boost::json::object{{"type", "pong"}}));
    }
    read_next();
  }

  void enqueue(Payload payload) {
    if (finished_) {
      return;
    }
    if (outbox_.size() >= kOutboxLimit) {
      spdlog::warn("observer {} fell {} messages behind, dropping it", observer_id_, outbox_.size());
      finish({});
      beast::error_code ignored;
      beast::get_lowest_layer(ws_).socket().close(ignored);
      return;
    }
    bool idle = outbox_.empty();
    outbox_.push_back(std::move(payload));
    if (idle) {
      flush();
    }
  }

  void flush() {
    ws_.text(true);
    ws_.async_write(net::buffer(*outbox_.front()),
                    beast::bind_front_handler(&ObserverSession::on_sent, shared_from_this()));
  }

  void on_sent(beast::error_code ec, std::size_t) {
    if (ec) {
      return finish(ec);
    }
    outbox_.pop_front();
    if (finished_) {
      outbox_.clear();
    } else if (!outbox_.empty()) {
      flush();
    }
  }

  void finish(beast::error_code ec) {
    if (finished_) {
      return;
    }
    finished_ = true;
    if (ec && ec != websocket::error::closed) {
      spdlog::debug("observer {} closed: {}", observer_id_, ec.message());
    }
    if (observer_id_ > 0) {
      simulation_->detach(observer_id_);
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  std::shared_ptr<Simulation> simulation_;
  beast::flat_buffer inbox_;
  std::deque<Payload> outbox_;
  int observer_id_ = 0;
  bool finished_ = false;
};

void Simulation::start() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  last_sync_at_ = clock_.now();
  arm(interval_);
}

void Simulation::stop() {
  std::lock_guard<std::mutex> guard(mutex_);
  running_ = false;
}

Simulation::Attachment Simulation::attach(const std::shared_ptr<ObserverSession>& session) {
  std::lock_guard<std::mutex> guard(mutex_);
  int id = next_observer_id_++;
  observers_.emplace(id, session);
  spdlog::info("observer {} attached ({} watching)", id, observers_.size());
  return {id, encode(protocol::world_state_message(world_.snapshot()))};
}

void Simulation::detach(int observer_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (observers_.erase(observer_id) > 0) {
    spdlog::info("observer {} detached ({} watching)", observer_id, observers_.size());
  }
}

std::string Simulation::world_json() {
  std::lock_guard<std::mutex> guard(mutex_);
  return boost::json::serialize(protocol::world_state(world_.snapshot()));
}

std::string Simulation::status_json() {
  std::lock_guard<std::mutex> guard(mutex_);
  return boost::json::serialize(protocol::status(world_.snapshot()));
}

void Simulation::arm(std::chrono::steady_clock::duration delay) {
  timer_.expires_after(delay);
  timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
    if (!ec) {
      self->step();
    }
  });
}

// Caller holds mutex_. Prunes observers whose sessions are gone.
std::vector<std::shared_ptr<ObserverSession>> Simulation::audience() {
  std::vector<std::shared_ptr<ObserverSession>> live;
  for (auto it = observers_.begin(); it != observers_.end();) {
    if (auto session = it->second.lock()) {
      live.push_back(std::move(session));
      ++it;
    } else {
      it = observers_.erase(it);
    }
  }
  return live;
}

void Simulation::step() {
  auto started = std::chrono::steady_clock::now();
  std::vector<Payload> batch;
  std::vector<std::shared_ptr<ObserverSession>> targets;
  long tick = 0;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!running_) {
      return;
    }
    EventList events = world_.update();
    tick = world_.tick();
    targets = audience();
    if (!targets.empty()) {
      batch.reserve(events.size() + 1);
      for (const Event& ev : events) {
        batch.push_back(encode(protocol::event_message(ev)));
      }
    }
    double now = clock_.now();
    if (now - last_sync_at_ >= cfg_.world_sync_interval) {
      last_sync_at_ = now;
      if (!targets.empty()) {
        batch.push_back(encode(protocol::world_state_message(world_.snapshot())));
      }
    }
  }

  if (!batch.empty()) {
    for (const auto& observer : targets) {
      observer->deliver(batch);
    }
  }

  auto spent = std::chrono::steady_clock::now() - started;
  if (spent > interval_) {
    spdlog::debug("tick {} overran its slot by {} us", tick,
                  std::chrono::duration_cast<std::chrono::microseconds>(spent - interval_).count());
    arm(std::chrono::steady_clock::duration::zero());
  } else {
    arm(interval_ - spent);
  }
}

// Plain HTTP: the JSON API, static assets and the WebSocket upgrade.
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(tcp::socket&& socket, std::shared_ptr<Simulation> simulation, fs::path static_root)
      : stream_(std::move(socket)),
        simulation_(std::move(simulation)),
        static_root_(std::move(static_root)) {}

  void start() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Connection::read_request, shared_from_this()));
  }

 private:
  void read_request() {
    request_ = {};
    stream_.expires_after(kRequestTimeout);
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&Connection::on_request, shared_from_this()));
  }

  void on_request(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      return shutdown();
    }
    if (ec) {
      spdlog::debug("http read failed: {}", ec.message());
      return;
    }
    if (websocket::is_upgrade(request_)) {
      if (request_.target() != kObserverPath) {
        return reply(plain(request_, http::status::not_found));
      }
      stream_.expires_never();
      std::make_shared<ObserverSession>(stream_.release_socket(), simulation_)->accept(std::move(request_));
      return;
    }
    reply(route(request_));
  }

  Response route(const Request& req) const {
    if (req.method() != http::verb::get) {
      return plain(req, http::status::method_not_allowed);
    }
    std::string path(req.target());
    path = path.substr(0, path.find('?'));
    if (path == "/api/world") {
      return make_response(req, http::status::ok, simulation_->world_json(), "application/json");
    }
    if (path == "/api/status") {
      return make_response(req, http::status::ok, simulation_->status_json(), "application/json");
    }
    if (path == "/") {
      return static_asset(req, "index.html");
    }
    if (path.rfind(kStaticPrefix, 0) == 0) {
      return static_asset(req, path.substr(std::strlen(kStaticPrefix)));
    }
    return plain(req, http::status::not_found);
  }

  Response static_asset(const Request& req, const std::string& relative) const {
    std::optional<fs::path> file = resolve_static(static_root_, relative);
    if (!file) {
      return plain(req, http::status::bad_request);
    }
    std::optional<std::string> content = load_file(*file);
    if (!content) {
      return plain(req, http::status::not_found);
    }
    return make_response(req, http::status::ok, std::move(*content), content_type_for(*file));
  }

  void reply(Response res) {
    response_ = std::move(res);
    http::async_write(stream_, response_, beast::bind_front_handler(&Connection::on_replied, shared_from_this()));
  }

  void on_replied(beast::error_code ec, std::size_t) {
    if (ec) {
      spdlog::debug("http write failed: {}", ec.message());
      return;
    }
    if (response_.need_eof()) {
      return shutdown();
    }
    read_request();
  }

  void shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  Request request_;
  Response response_;
  std::shared_ptr<Simulation> simulation_;
  fs::path static_root_;
};

class Acceptor : public std::enable_shared_from_this<Acceptor> {
 public:
  Acceptor(net::io_context& ioc, std::shared_ptr<Simulation> simulation, fs::path static_root)
      : ioc_(ioc),
        acceptor_(ioc),
        simulation_(std::move(simulation)),
        static_root_(std::move(static_root)) {}

  beast::error_code listen(const tcp::endpoint& endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      return ec;
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      return ec;
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
      return ec;
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    return ec;
  }

  void start() {
    accept_next();
  }

  void stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      beast::error_code ignored;
      self->acceptor_.close(ignored);
    });
  }

 private:
  // Each connection gets its own strand.
  void accept_next() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&Acceptor::on_accept, shared_from_this()));
  }

  void on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    if (ec) {
      spdlog::warn("accept failed: {}", ec.message());
    } else {
      std::make_shared<Connection>(std::move(socket), simulation_, static_root_)->start();
    }
    accept_next();
  }

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<Simulation> simulation_;
  fs::path static_root_;
};

}  // namespace

int run(const ServerConfig& config, const config::Config& game) {
  int threads = std::max(1, config.threads);
  net::io_context ioc{threads};

  beast::error_code ec;
  auto address = net::ip::make_address(config.host, ec);
  if (ec) {
    spdlog::error("invalid host address '{}': {}", config.host, ec.message());
    return 1;
  }
  tcp::endpoint endpoint{address, static_cast<unsigned short>(config.port)};

  auto simulation = std::make_shared<Simulation>(ioc, game);
  auto acceptor = std::make_shared<Acceptor>(ioc, simulation, fs::path(config.static_dir));
  ec = acceptor->listen(endpoint);
  if (ec) {
    spdlog::error("cannot listen on {}:{}: {}", config.host, config.port, ec.message());
    return 1;
  }

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](beast::error_code wait_ec, int signal_number) {
    if (wait_ec) {
      return;
    }
    spdlog::info("caught signal {}, shutting down", signal_number);
    simulation->stop();
    acceptor->stop();
    ioc.stop();
  });

  simulation->start();
  acceptor->start();
  spdlog::info("serving {} on {}:{} with {} thread(s) at {} ticks/s", config.static_dir, config.host, config.port,
               threads, game.tick_rate);

  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(threads - 1));
  for (int i = 1; i < threads; ++i) {
    workers.emplace_back([&ioc]() { ioc.run(); });
  }
  ioc.run();
  for (auto& worker : workers) {
    worker.join();
  }
  spdlog::info("server stopped");
  return 0;
}

}  // namespace soulwar::server
