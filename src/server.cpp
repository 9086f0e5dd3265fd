#include "askllm/server.hpp"
#include "askllm/front_door.hpp"
#include "askllm/url.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <string_view>
#include <utility>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

using askllm::HttpRequest;
using askllm::HttpResponse;
using askllm::RequestHandler;
namespace http = askllm::http;

constexpr auto kReadTimeout = std::chrono::seconds(30);

std::string_view to_std(beast::string_view s) {
  return std::string_view(s.data(), s.size());
}

// One connection. Reads and writes run on the connection's strand, the
// handler runs on the worker pool.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket&& socket, const RequestHandler& handler, asio::thread_pool& workers)
      : stream_(std::move(socket)), handler_(handler), workers_(workers) {}

  void run() {
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&Session::do_read, shared_from_this()));
  }

private:
  void do_read() {
    req_ = {};
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) return do_close();
    if (ec) {
      if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
        spdlog::debug("read: {}", ec.message());
      }
      return;
    }
    stream_.expires_never();
    asio::post(workers_, [self = shared_from_this()] { self->handle(); });
  }

  void handle() {
    auto started = std::chrono::steady_clock::now();
    HttpResponse res;
    try {
      res = handler_(req_);
    } catch (const std::exception& e) {
      spdlog::error("Unhandled error for {}: {}", to_std(req_.target()), e.what());
      res = askllm::make_text_response(req_, http::status::internal_server_error,
                                       askllm::kInternalErrorText);
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - started).count();
    spdlog::info("{} {} {} {}ms", to_std(req_.method_string()), to_std(req_.target()),
                 res.result_int(), ms);

    asio::post(stream_.get_executor(),
               [self = shared_from_this(), res = std::move(res)]() mutable {
                 self->do_write(std::move(res));
               });
  }

  void do_write(HttpResponse&& res) {
    res_ = std::move(res);
    bool keep_alive = res_.keep_alive();
    http::async_write(stream_, res_,
                      beast::bind_front_handler(&Session::on_write, shared_from_this(), keep_alive));
  }

  void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
    if (ec) {
      spdlog::debug("write: {}", ec.message());
      return;
    }
    if (!keep_alive) return do_close();
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) spdlog::debug("shutdown: {}", ec.message());
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  HttpRequest req_;
  HttpResponse res_;
  const RequestHandler& handler_;
  asio::thread_pool& workers_;
};

} // namespace

namespace askllm {

HttpServer::HttpServer(ServerOptions opts, RequestHandler handler)
    : opts_(std::move(opts)), handler_(std::move(handler)), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
  stop();
}

void HttpServer::start() {
  if (running_) return;

  tcp::endpoint ep{asio::ip::make_address(opts_.host), opts_.port};
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen(asio::socket_base::max_listen_connections);

  unsigned n = opts_.workers;
  if (n == 0) n = std::max(4u, std::thread::hardware_concurrency());
  workers_ = std::make_unique<asio::thread_pool>(n);

  do_accept();
  running_ = true;
  for (unsigned i = 0; i < std::max(1u, opts_.io_threads); ++i) {
    io_threads_.emplace_back([this] { ioc_.run(); });
  }
  spdlog::info("Listening on {}:{} ({} workers)", opts_.host, port(), n);
}

void HttpServer::stop() {
  if (!running_.exchange(false)) return;

  ioc_.stop();
  for (auto& t : io_threads_) t.join();
  io_threads_.clear();

  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) spdlog::warn("closing acceptor: {}", ec.message());

  workers_->join();
  spdlog::info("Server stopped");
}

unsigned short HttpServer::port() const {
  beast::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? opts_.port : ep.port();
}

void HttpServer::do_accept() {
  acceptor_.async_accept(asio::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted) return;
    if (ec) {
      spdlog::warn("accept: {}", ec.message());
    } else {
      std::make_shared<Session>(std::move(socket), handler_, *workers_)->run();
    }
    do_accept();
  });
}

HttpResponse make_text_response(const HttpRequest& req, http::status status, std::string body) {
  HttpResponse res{status, req.version()};
  res.set(http::field::server, "askllm");
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

RequestHandler make_gateway_handler(std::shared_ptr<const Completer> completer) {
  return [completer = std::move(completer)](const HttpRequest& req) {
    std::string_view target = to_std(req.target());
    if (req.method() != http::verb::get || target_path(target) != "/") {
      return make_text_response(req, http::status::not_found, "404 page not found");
    }
    Reply reply = handle_query(query_param(target_query(target), "q"), *completer);
    return make_text_response(req, static_cast<http::status>(reply.status), std::move(reply.body));
  };
}

} // namespace askllm
