#include "noted/http/server.hpp"

#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <spdlog/spdlog.h>

#include "noted/http/api_types.hpp"

namespace noted::http {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace beast_http = boost::beast::http;

namespace {

Response payloadTooLarge(unsigned version) {
  Response response{beast_http::status::payload_too_large, version};
  response.set(beast_http::field::server, "noted/" + getVersion().toString());
  response.set(beast_http::field::content_type, "application/json");
  response.keep_alive(false);
  response.body() = messageBody("payload too large").dump();
  response.prepare_payload();
  return response;
}

bool isDisconnect(const boost::system::error_code& ec) {
  return ec == beast::error::timeout ||
         ec == asio::error::operation_aborted ||
         ec == asio::error::connection_reset ||
         ec == asio::error::eof;
}

// Serves requests on one connection until the peer closes it, a read
// times out, or a response asks for the connection to be closed.
asio::awaitable<void> runSession(beast::tcp_stream stream,
                                 std::shared_ptr<const RequestHandler> handler,
                                 asio::thread_pool::executor_type handler_executor,
                                 HttpServer::Options options) {
  boost::system::error_code ec;
  beast::flat_buffer buffer;

  while (true) {
    beast_http::request_parser<beast_http::string_body> parser;
    parser.body_limit(options.body_limit);

    stream.expires_after(options.read_timeout);
    co_await beast_http::async_read(stream, buffer, parser,
                                    asio::redirect_error(asio::use_awaitable, ec));

    if (ec == beast_http::error::end_of_stream) {
      stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
      co_return;
    }

    if (ec == beast_http::error::body_limit) {
      spdlog::warn("Rejected request body over {} bytes", options.body_limit);
      auto response = payloadTooLarge(parser.get().version());
      stream.expires_after(options.read_timeout);
      co_await beast_http::async_write(stream, response,
                                       asio::redirect_error(asio::use_awaitable, ec));
      stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
      co_return;
    }

    if (ec) {
      if (isDisconnect(ec)) {
        spdlog::debug("Connection closed while reading: {}", ec.message());
      } else {
        spdlog::warn("Error reading HTTP request: {}", ec.message());
      }
      co_return;
    }

    const auto& request = parser.get();

    auto response = co_await asio::co_spawn(
        handler_executor,
        [&]() -> asio::awaitable<Response> { co_return handler->handle(request); },
        asio::use_awaitable);

    bool keep_alive = response.keep_alive();

    stream.expires_after(options.read_timeout);
    co_await beast_http::async_write(stream, response,
                                     asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      spdlog::warn("Error writing HTTP response: {}", ec.message());
      co_return;
    }

    if (!keep_alive) {
      stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
      co_return;
    }
  }
}

}  // namespace

HttpServer::HttpServer(asio::io_context& io_context,
                       std::shared_ptr<const RequestHandler> handler,
                       Options options)
    : io_context_(io_context),
      handler_(std::move(handler)),
      options_(std::move(options)),
      acceptor_(io_context),
      handler_pool_(options_.handler_threads == 0 ? 1 : options_.handler_threads) {}

HttpServer::~HttpServer() {
  stop();
}

Result<asio::ip::tcp::endpoint> HttpServer::listen() {
  boost::system::error_code ec;

  auto address = asio::ip::make_address(options_.address, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid listen address '" + options_.address + "': " +
                                     ec.message()));
  }

  asio::ip::tcp::endpoint endpoint(address, options_.port);

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to listen on " + options_.address + ":" +
                                     std::to_string(options_.port) + ": " + ec.message()));
  }

  auto bound = acceptor_.local_endpoint(ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "Failed to read bound endpoint: " + ec.message()));
  }
  return bound;
}

void HttpServer::start() {
  asio::co_spawn(io_context_, acceptLoop(), [](std::exception_ptr ptr) {
    if (ptr) {
      try {
        std::rethrow_exception(ptr);
      } catch (const std::exception& e) {
        spdlog::error("Accept loop terminated: {}", e.what());
      }
    }
  });
}

void HttpServer::stop() {
  if (acceptor_.is_open()) {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      spdlog::warn("Error closing acceptor: {}", ec.message());
    }
  }
  handler_pool_.join();
}

asio::awaitable<void> HttpServer::acceptLoop() {
  while (acceptor_.is_open()) {
    boost::system::error_code ec;
    auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));

    if (ec == asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      spdlog::warn("Accept failed: {}", ec.message());
      continue;
    }

    beast::tcp_stream stream(std::move(socket));
    auto session = [stream = std::move(stream), handler = handler_,
                    executor = handler_pool_.get_executor(), options = options_]() mutable {
      return runSession(std::move(stream), std::move(handler), executor, std::move(options));
    };

    asio::co_spawn(asio::make_strand(io_context_), std::move(session), [](std::exception_ptr ptr) {
      if (ptr) {
        try {
          std::rethrow_exception(ptr);
        } catch (const std::exception& e) {
          spdlog::error("Uncaught error in a session: {}", e.what());
        }
      }
    });
  }
}

}  // namespace noted::http
