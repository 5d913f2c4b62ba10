#ifndef OBJSTORE_HTTP_HTTP_SERVER_HPP
#define OBJSTORE_HTTP_HTTP_SERVER_HPP

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "http/request_handler.hpp"
#include "logger/logger.hpp"

namespace objstore::http {

// One keep-alive connection: read a request, hand it to the handler, write
// the response, repeat until the peer or the handler closes it
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  // Delete copy operations to prevent socket duplication
  HttpSession(const HttpSession&) = delete;
  HttpSession& operator=(const HttpSession&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpSession(boost::asio::ip::tcp::socket&& socket, RequestHandler& handler, logging::Logger& logger);


  // ---- SESSION CONTROL ----
  void run();

private:
  // ---- PARAMETERS ----
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  std::shared_ptr<Response> response_;
  RequestHandler& handler_;
  logging::Logger& logger_;


  // ---- INCOMING REQUEST PROCESSING ----
  void read_header();
  void on_header(const boost::system::error_code& ec, std::size_t bytes_transferred);
  void on_body(const boost::system::error_code& ec, std::size_t bytes_transferred);


  // ---- OUTGOING RESPONSE PROCESSING ----
  void write(Response response, bool close);
  void on_write(bool close, const boost::system::error_code& ec, std::size_t bytes_transferred);


  // ---- TEARDOWN ----
  // Stops sending, then discards whatever the peer still sends so the
  // response is not lost to a reset
  void linger();
  void drain();
  void close();
};

class HttpServer {
public:
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(std::uint16_t port, const std::string& address, RequestHandler& handler,
             logging::Logger& logger, std::size_t workers = 1);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Port actually bound, useful when listening on port 0
  std::uint16_t bound_port() const { return bound_port_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const std::uint16_t port_;
  const std::string address_;
  const std::size_t workers_;
  std::uint16_t bound_port_{0};

  // Server state
  std::atomic<bool> is_running_{false};
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;

  // System components
  RequestHandler& handler_;
  logging::Logger& logger_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace objstore::http

#endif // OBJSTORE_HTTP_HTTP_SERVER_HPP
