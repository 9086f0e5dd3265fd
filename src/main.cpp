#include "askllm/completion_client.hpp"
#include "askllm/config.hpp"
#include "askllm/http.hpp"
#include "askllm/logging.hpp"
#include "askllm/server.hpp"
#include <csignal>
#include <exception>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  askllm::init_logging("info");

  askllm::Config cfg;
  try {
    cfg = askllm::load_config(askllm::process_env, argc, argv);
  } catch (const std::exception& e) {
    spdlog::critical("Error: {}", e.what());
    return 1;
  }
  askllm::init_logging(cfg.log_level);

  try {
    askllm::http_global_init();

    auto client = std::make_shared<askllm::CompletionClient>(cfg.client);
    askllm::HttpServer server(cfg.server, askllm::make_gateway_handler(client));
    server.start();
    spdlog::info("AskLLM (DeepSeek) server started on port :{}, model {}", server.port(),
                 cfg.client.model);

    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
      if (!ec) spdlog::info("Received signal {}, shutting down", sig);
      server.stop();
    });
    signals_ioc.run();
  } catch (const std::exception& e) {
    spdlog::critical("Failed to start server: {}", e.what());
    askllm::http_global_cleanup();
    return 1;
  }

  askllm::http_global_cleanup();
  return 0;
}
