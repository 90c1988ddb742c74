#pragma once
/// @file telemetry_server.hpp
/// @brief Boost.Beast HTTP + WebSocket server streaming residency telemetry.
///
/// HTTP:      GET /snapshot  residency snapshot JSON
///            GET /plan      last placement plan JSON
/// WebSocket: the snapshot on connect, then every broadcast() message.
///            Client text frames go to the command handler.

#include <utility>  // std::exchange, needed by Boost.Asio awaitable.hpp under C++23

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace frag_res {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

/// @brief Produces a JSON document on demand (snapshot, plan).
using JsonProvider = std::function<std::string()>;

/// @brief Callback invoked when a WebSocket client sends a text message.
using CommandHandler = std::function<void(const std::string &)>;

/// @brief Providers and handlers shared by every session.
struct TelemetryHandlers {
  JsonProvider snapshot;
  JsonProvider plan;
  CommandHandler on_command;
};

/// @brief Latest copy of a JSON document, published by the epoch loop.
///
/// Providers backed by this never touch controller state, so HTTP and
/// WebSocket handlers on the io thread do not wait for a running epoch.
class PublishedJson {
public:
  void publish(std::string json);
  [[nodiscard]] auto get() const -> std::string;

  /// @brief Provider returning get(). Must not outlive this object.
  [[nodiscard]] auto provider() const -> JsonProvider;

private:
  mutable std::mutex mutex_;
  std::string json_;
};

/// @brief One client connection: a single HTTP request or a WebSocket.
class TelemetrySession
    : public std::enable_shared_from_this<TelemetrySession> {
public:
  TelemetrySession(tcp::socket socket,
                   std::shared_ptr<const TelemetryHandlers> handlers);

  /// @brief Read the first request and either answer it or upgrade.
  void run();

  /// @brief Queue a text frame (no-op until the upgrade completes).
  void send(std::string message);

  /// @brief False once the connection is known to be gone.
  [[nodiscard]] auto is_alive() const -> bool;

private:
  void on_accept(beast::error_code ec);
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes_transferred);
  void handle_http_request(const http::request<http::string_body> &req);

  beast::flat_buffer buffer_;
  ws::stream<beast::tcp_stream> ws_;
  http::request<http::string_body> req_;
  std::atomic<bool> is_websocket_{false};
  std::atomic<bool> closed_{false};
  std::shared_ptr<const TelemetryHandlers> handlers_;
};

/// @brief Build the HTTP response for @p target ("/snapshot", "/plan", ...).
[[nodiscard]] auto route_request(const std::string &target,
                                 const TelemetryHandlers &handlers)
    -> http::response<http::string_body>;

class TelemetryServer {
public:
  /// @param port  TCP port to listen on (0 picks a free port).
  explicit TelemetryServer(unsigned short port, TelemetryHandlers handlers);

  /// @brief Accept connections. Blocks on io_context.run() until stop().
  void run();

  /// @brief Stop the server. Safe from any thread.
  void stop();

  /// @brief Send a text message to every connected WebSocket client.
  void broadcast(const std::string &message);

  /// @brief Port actually bound.
  [[nodiscard]] auto port() const -> unsigned short;

  /// @brief Sessions not yet known to be closed.
  [[nodiscard]] auto session_count() -> std::size_t;

private:
  void do_accept();

  net::io_context ioc_{1};
  tcp::acceptor acceptor_;
  std::shared_ptr<const TelemetryHandlers> handlers_;

  std::mutex sessions_mutex_;
  std::vector<std::shared_ptr<TelemetrySession>> sessions_;
};

} // namespace frag_res
