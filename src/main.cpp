#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "config/config.hpp"
#include "http/http_server.hpp"
#include "http/request_handler.hpp"
#include "logger/logger.hpp"
#include "store/object_store.hpp"
#include "store/store_error.hpp"

using namespace objstore;

std::unique_ptr<store::ObjectStore> create_store(const config::ServerConfig& config, logging::Logger& logger) {
  if (!config.persist) {
    OBJSTORE_LOG_INFO(logger) << "Using in-memory storage, objects are lost on shutdown";
    return std::make_unique<store::ObjectStore>(std::in_place_type<store::MemoryStore>);
  }

  std::error_code ec;
  std::filesystem::create_directories(config.data_path, ec);
  if (ec) {
    throw store::ConfigurationError("cannot create data path " + config.data_path + ": " + ec.message());
  }
  OBJSTORE_LOG_INFO(logger) << "Using persistent storage in " << config.data_path;
  return std::make_unique<store::ObjectStore>(std::in_place_type<store::FileStore>, config.data_path, logger);
}

bool run_server(const config::ServerConfig& config) {
  logging::Logger logger;

  try {
    auto object_store = create_store(config, logger);
    http::RequestHandler handler(*object_store, logger, config.max_object_size);
    http::HttpServer server(config.listen_port, config.listen_host, handler, logger, config.workers);

    if (!server.start_listener()) {
      OBJSTORE_LOG_FATAL(logger) << "Failed to start HTTP server on "
                                 << config.listen_host << ":" << config.listen_port;
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([&logger](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        OBJSTORE_LOG_INFO(logger) << "Received signal " << signal_number << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    OBJSTORE_LOG_INFO(logger) << "Bye.";
    return true;
  } catch (const store::StoreError& e) {
    OBJSTORE_LOG_FATAL(logger) << "Failed to initialize storage: " << e.what();
    return false;
  } catch (const std::exception& e) {
    OBJSTORE_LOG_FATAL(logger) << "Server error: " << e.what();
    return false;
  }
}

int main(int argc, char* argv[]) {
  config::ServerConfig config;
  try {
    config = config::load_config(argc, argv);
  } catch (const config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n' << config::usage(argv[0]);
    return 1;
  }

  if (config.show_help) {
    std::cout << config.usage;
    return 0;
  }

  logging::init_logging(config.verbose ? logging::severity_level::debug : logging::severity_level::info,
                        config.log_file);

  const bool ok = run_server(config);
  logging::shutdown_logging();
  return ok ? 0 : 1;
}
