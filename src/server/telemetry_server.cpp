/// @file telemetry_server.cpp
/// @brief Implementation of the telemetry HTTP + WebSocket server.

#include "server/telemetry_server.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace frag_res {

// ─── Routing ────────────────────────────────────────────────────────────

auto route_request(const std::string &target,
                   const TelemetryHandlers &handlers)
    -> http::response<http::string_body> {
  // Query strings are ignored.
  const auto path = target.substr(0, target.find('?'));

  const JsonProvider *provider = nullptr;
  if (path == "/snapshot") {
    provider = &handlers.snapshot;
  } else if (path == "/plan") {
    provider = &handlers.plan;
  }

  if (provider == nullptr || !*provider) {
    http::response<http::string_body> res{http::status::not_found, 11};
    res.set(http::field::content_type, "text/plain");
    res.body() = "404 Not Found: " + path;
    return res;
  }

  http::response<http::string_body> res{http::status::ok, 11};
  res.set(http::field::content_type, "application/json");
  res.set(http::field::access_control_allow_origin, "*");
  res.body() = (*provider)();
  return res;
}

// ─── TelemetrySession ───────────────────────────────────────────────────

TelemetrySession::TelemetrySession(
    tcp::socket socket, std::shared_ptr<const TelemetryHandlers> handlers)
    : ws_{std::move(socket)}, handlers_{std::move(handlers)} {}

void TelemetrySession::run() {
  http::async_read(
      ws_.next_layer(), buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
          self->closed_ = true;
          return;
        }

        if (ws::is_upgrade(self->req_)) {
          self->ws_.async_accept(self->req_, [self](beast::error_code ec2) {
            self->on_accept(ec2);
          });
        } else {
          self->handle_http_request(self->req_);
        }
      });
}

void TelemetrySession::on_accept(beast::error_code ec) {
  if (ec) {
    closed_ = true;
    return;
  }
  is_websocket_ = true;
  if (handlers_->snapshot) {
    send(handlers_->snapshot());
  }
  do_read();
}

void TelemetrySession::do_read() {
  ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec,
                                                      std::size_t bytes) {
    self->on_read(ec, bytes);
  });
}

void TelemetrySession::on_read(beast::error_code ec,
                               std::size_t /*bytes_transferred*/) {
  if (ec) {
    closed_ = true;
    return;
  }

  if (handlers_->on_command) {
    auto msg = beast::buffers_to_string(buffer_.data());
    if (!msg.empty()) {
      handlers_->on_command(msg);
    }
  }
  buffer_.consume(buffer_.size());
  do_read();
}

void TelemetrySession::send(std::string message) {
  if (!is_websocket_ || closed_)
    return;

  auto msg = std::make_shared<std::string>(std::move(message));

  net::post(ws_.get_executor(), [self = shared_from_this(), msg]() {
    beast::error_code ec;
    self->ws_.text(true);
    self->ws_.write(net::buffer(*msg), ec);
    if (ec) {
      self->closed_ = true;
    }
  });
}

// Called from broadcast() on other threads: only the atomic flag is read,
// ws_ belongs to the io thread.
auto TelemetrySession::is_alive() const -> bool { return !closed_; }

void TelemetrySession::handle_http_request(
    const http::request<http::string_body> &req) {
  auto response = route_request(std::string(req.target()), *handlers_);
  response.set(http::field::server, "frag_res/0.1");
  // One request per connection.
  response.keep_alive(false);
  response.prepare_payload();

  beast::error_code ec;
  http::write(ws_.next_layer(), response, ec);
  if (ec) {
    std::cerr << "[Telemetry] write failed: " << ec.message() << "\n";
  }
  closed_ = true;
}

// ─── PublishedJson ──────────────────────────────────────────────────────

void PublishedJson::publish(std::string json) {
  std::lock_guard lock(mutex_);
  json_ = std::move(json);
}

auto PublishedJson::get() const -> std::string {
  std::lock_guard lock(mutex_);
  return json_;
}

auto PublishedJson::provider() const -> JsonProvider {
  return [this] { return get(); };
}

// ─── TelemetryServer ────────────────────────────────────────────────────

TelemetryServer::TelemetryServer(unsigned short port,
                                 TelemetryHandlers handlers)
    : acceptor_{ioc_, tcp::endpoint{tcp::v4(), port}},
      handlers_{std::make_shared<const TelemetryHandlers>(std::move(handlers))} {
  acceptor_.set_option(net::socket_base::reuse_address(true));
}

void TelemetryServer::run() {
  std::cout << "[Telemetry] Listening on http://localhost:" << port()
            << " (GET /snapshot, GET /plan)\n";
  std::cout << "[Telemetry] WebSocket at ws://localhost:" << port() << "/ws\n";

  do_accept();
  ioc_.run();
}

void TelemetryServer::stop() { ioc_.stop(); }

auto TelemetryServer::port() const -> unsigned short {
  return acceptor_.local_endpoint().port();
}

void TelemetryServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec)
      return;

    auto session =
        std::make_shared<TelemetrySession>(std::move(socket), handlers_);
    {
      std::lock_guard lock(sessions_mutex_);
      sessions_.push_back(session);
    }
    session->run();

    do_accept();
  });
}

void TelemetryServer::broadcast(const std::string &message) {
  std::lock_guard lock(sessions_mutex_);

  std::erase_if(sessions_, [](const auto &s) { return !s->is_alive(); });

  for (auto &session : sessions_) {
    session->send(message);
  }
}

auto TelemetryServer::session_count() -> std::size_t {
  std::lock_guard lock(sessions_mutex_);
  std::erase_if(sessions_, [](const auto &s) { return !s->is_alive(); });
  return sessions_.size();
}

} // namespace frag_res
