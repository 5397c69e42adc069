#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "noted/common.hpp"
#include "noted/http/request_handler.hpp"

namespace noted::http {

// HTTP/1.1 server: one accept loop plus one coroutine per connection, each
// on its own strand. Request handling is moved to a separate thread pool so
// SQLite calls never block the I/O threads.
class HttpServer {
 public:
  struct Options {
    std::string address = "0.0.0.0";
    uint16_t port = 8081;
    size_t body_limit = 1024 * 1024;
    std::chrono::seconds read_timeout{60};
    size_t handler_threads = 4;
  };

  HttpServer(boost::asio::io_context& io_context,
             std::shared_ptr<const RequestHandler> handler,
             Options options);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Open, bind and listen. Port 0 binds an ephemeral port; the bound
  // endpoint is returned either way.
  Result<boost::asio::ip::tcp::endpoint> listen();

  // Spawn the accept loop on the io_context. Requires a successful listen().
  void start();

  // Close the acceptor and wait for in-flight handlers to finish.
  void stop();

 private:
  boost::asio::awaitable<void> acceptLoop();

  boost::asio::io_context& io_context_;
  std::shared_ptr<const RequestHandler> handler_;
  Options options_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool handler_pool_;
};

}  // namespace noted::http
