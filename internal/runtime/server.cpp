#include "server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string_view>

#include "internal/http/query_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldlink::runtime {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp       = boost::asio::ip::tcp;

namespace {

constexpr std::chrono::milliseconds kDisconnectPollInterval{25};

std::string_view ToStringView(beast::string_view sv) {
  return {sv.data(), sv.size()};
}

// True once the peer closed or reset the connection. Pipelined bytes do not count.
bool PeerClosed(tcp::socket& socket) {
  beast::error_code ec;
  socket.non_blocking(true, ec);
  if (ec) return false;

  char       byte;
  const auto n = socket.receive(boost::asio::buffer(&byte, 1), tcp::socket::message_peek, ec);

  beast::error_code restore_ec;
  socket.non_blocking(false, restore_ec);

  if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) return false;
  return ec || n == 0;
}

// Runs the handler off the connection thread and cancels the resolution when
// the client goes away. Returns false when nobody is left to answer.
bool HandleWhileConnected(tcp::socket& socket, const http::QueryHandler& handler,
                          const bhttp::request<bhttp::string_body>& req, http::HttpReply& reply) {
  auto cancel      = std::make_shared<std::atomic<bool>>(false);
  bool client_gone = false;

  auto pending = std::async(std::launch::async, [&handler, &req, cancel] {
    return handler.Handle(ToStringView(req.method_string()), ToStringView(req.target()), cancel);
  });

  while (pending.wait_for(kDisconnectPollInterval) != std::future_status::ready) {
    if (!client_gone && PeerClosed(socket)) {
      client_gone = true;
      FIELDLINK_LOG_INFO("client disconnected, cancelling request",
                         {observability::StringField("target", ToStringView(req.target()))});
      cancel->store(true);
    }
  }

  try {
    reply = pending.get();
  } catch (const std::exception& e) {
    FIELDLINK_LOG_ERROR("HTTP handler failed", {observability::StringField("error", e.what())});
    reply.status = 500;
    reply.body   = R"({"success":false,"message":"internal error","data":{}})";
  }
  return !client_gone;
}

void Session(tcp::socket& socket, const http::QueryHandler& handler) {
  beast::error_code  ec;
  beast::flat_buffer buffer;

  for (;;) {
    bhttp::request<bhttp::string_body> req;
    bhttp::read(socket, buffer, req, ec);
    if (ec == bhttp::error::end_of_stream) break;
    if (ec) {
      FIELDLINK_LOG_DEBUG("HTTP read failed", {observability::StringField("error", ec.message())});
      break;
    }

    http::HttpReply reply;
    if (!HandleWhileConnected(socket, handler, req, reply)) break;

    bhttp::response<bhttp::string_body> res{static_cast<bhttp::status>(reply.status), req.version()};
    res.set(bhttp::field::server, "fieldlink");
    res.set(bhttp::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(reply.body);
    res.prepare_payload();

    bhttp::write(socket, res, ec);
    if (ec || !res.keep_alive()) break;
  }

  socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace

Endpoint ParseBindAddress(const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos) {
    throw util::ConfigError("invalid listen address `" + bind_address + "`, expected host:port");
  }

  Endpoint endpoint;
  endpoint.host = bind_address.substr(0, colon);
  if (endpoint.host.size() >= 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }
  if (endpoint.host.empty()) {
    endpoint.host = "0.0.0.0";
  }

  const auto port = bind_address.substr(colon + 1);
  std::size_t consumed = 0;
  unsigned long value  = 0;
  try {
    value = std::stoul(port, &consumed);
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (port.empty() || consumed != port.size() || value > 65535) {
    throw util::ConfigError("invalid port in listen address `" + bind_address + "`");
  }
  endpoint.port = static_cast<unsigned short>(value);
  return endpoint;
}

tcp::endpoint ResolveEndpoint(boost::asio::io_context& ioc, const Endpoint& endpoint) {
  beast::error_code ec;
  const auto        address = boost::asio::ip::make_address(endpoint.host, ec);
  if (!ec) {
    return {address, endpoint.port};
  }

  tcp::resolver resolver(ioc);
  const auto    results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
  if (ec || results.empty()) {
    throw util::ConfigError("cannot resolve listen host `" + endpoint.host + "`: " +
                            (ec ? ec.message() : std::string("no addresses")));
  }

  // prefer IPv4 so "localhost" binds where clients usually connect
  for (const auto& entry : results) {
    if (entry.endpoint().address().is_v4()) {
      return entry.endpoint();
    }
  }
  return results.begin()->endpoint();
}

Server::Server(std::string bind_address, std::shared_ptr<const http::QueryHandler> handler)
    : bind_address_(std::move(bind_address)), handler_(std::move(handler)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  const auto endpoint = ParseBindAddress(bind_address_);

  const auto bind_endpoint = ResolveEndpoint(ioc_, endpoint);

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(ioc_, bind_endpoint);
  } catch (const std::exception& e) {
    throw std::runtime_error("error binding tcp socket " + bind_address_ + ": " + e.what());
  }

  DoAccept();
  thread_ = std::thread([this] { ioc_.run(); });

  FIELDLINK_LOG_INFO("starting HTTP server", {observability::StringField("listen", bind_address_),
                                              observability::IntField("port", Port())});
}

void Server::Wait() {
  if (thread_.joinable())
    thread_.join();
}

void Server::Stop() {
  ioc_.stop();
  Wait();
  if (acceptor_) {
    beast::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }

  std::unique_lock lock(sessions_mutex_);
  for (const auto& socket : sessions_) {
    beast::error_code ec;
    socket->shutdown(tcp::socket::shutdown_both, ec);
  }
  sessions_cv_.wait(lock, [this] { return sessions_.empty(); });
}

unsigned short Server::Port() const {
  return acceptor_ ? acceptor_->local_endpoint().port() : 0;
}

void Server::DoAccept() {
  acceptor_->async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        FIELDLINK_LOG_WARN("accept failed", {observability::StringField("error", ec.message())});
        DoAccept();
      }
      return;
    }

    auto session = std::make_shared<tcp::socket>(std::move(socket));
    {
      std::lock_guard lock(sessions_mutex_);
      sessions_.insert(session);
    }
    std::thread(&Server::Serve, this, std::move(session)).detach();
    DoAccept();
  });
}

void Server::Serve(std::shared_ptr<tcp::socket> socket) {
  Session(*socket, *handler_);

  // the socket must be gone before Stop() can return
  std::lock_guard lock(sessions_mutex_);
  sessions_.erase(socket);
  socket.reset();
  sessions_cv_.notify_all();
}

} // namespace fieldlink::runtime
