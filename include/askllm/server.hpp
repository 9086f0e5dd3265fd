#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include "askllm/completion_client.hpp"

namespace askllm {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Runs on a worker thread and may block.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct ServerOptions {
  std::string host = "0.0.0.0";
  unsigned short port = 8080;
  unsigned io_threads = 1;
  unsigned workers = 0; // 0: max(4, hardware threads)
};

class HttpServer {
public:
  HttpServer(ServerOptions opts, RequestHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds, listens and spawns the I/O threads. Throws
  // boost::system::system_error when the address cannot be bound.
  void start();

  // Stops accepting, waits for in-flight handlers. Idempotent.
  void stop();

  bool is_running() const { return running_; }

  // Bound port; differs from the requested one when that was 0.
  unsigned short port() const;

private:
  void do_accept();

  ServerOptions opts_;
  RequestHandler handler_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unique_ptr<boost::asio::thread_pool> workers_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
};

HttpResponse make_text_response(const HttpRequest& req, http::status status, std::string body);

// GET / goes to the front door; everything else is 404.
RequestHandler make_gateway_handler(std::shared_ptr<const Completer> completer);

} // namespace askllm
