#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace fieldlink::http {
class QueryHandler;
}

namespace fieldlink::runtime {

struct Endpoint {
  std::string   host;
  unsigned short port = 0;
};

// "host:port", "[v6]:port" or ":port". Throws util::ConfigError.
Endpoint ParseBindAddress(const std::string& bind_address);

// IP literals are used as is; host names are resolved, IPv4 first.
boost::asio::ip::tcp::endpoint ResolveEndpoint(boost::asio::io_context& ioc, const Endpoint& endpoint);

/*
  HTTP/1.1 listener.

  Accepts on a dedicated io_context thread; every connection is served
  synchronously on its own thread so a slow resolution never blocks accept.
  Stop() shuts down open connections and waits for their threads.
*/
class Server {
public:
  Server(std::string bind_address, std::shared_ptr<const http::QueryHandler> handler);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Bound port, useful when listening on port 0.
  unsigned short Port() const;

private:
  void DoAccept();
  void Serve(std::shared_ptr<boost::asio::ip::tcp::socket> socket);

  std::string bind_address_;
  std::shared_ptr<const http::QueryHandler> handler_;

  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread thread_;

  std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> sessions_;
};

} // namespace fieldlink::runtime
