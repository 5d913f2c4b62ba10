#include "http/http_server.hpp"
#include <chrono>

namespace objstore::http {

namespace {

constexpr std::chrono::seconds kReadTimeout{30};
constexpr std::chrono::seconds kWriteTimeout{30};
constexpr std::chrono::seconds kLingerTimeout{5};

} // namespace

//==============================================
// SESSION: CONSTRUCTOR
//==============================================

HttpSession::HttpSession(boost::asio::ip::tcp::socket&& socket, RequestHandler& handler,
                         logging::Logger& logger)
  : stream_(std::move(socket))
  , handler_(handler)
  , logger_(logger) {}

void HttpSession::run() {
  // Start on the session's strand
  boost::asio::dispatch(stream_.get_executor(),
    [self = shared_from_this()]() { self->read_header(); });
}


//==============================================
// SESSION: INCOMING REQUEST PROCESSING
//==============================================

void HttpSession::read_header() {
  parser_.emplace();
  // Declared lengths are judged by check_headers, the limit applies to the body read
  parser_->body_limit(boost::none);

  stream_.expires_after(kReadTimeout);
  beast_http::async_read_header(stream_, buffer_, *parser_,
    [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
      self->on_header(ec, bytes);
    });
}

void HttpSession::on_header(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::end_of_stream) {
    close();
    return;
  }
  if (ec == beast_http::error::body_limit) {
    Response response = handler_.payload_too_large(parser_->get());
    handler_.log_access(parser_->get(), response);
    write(std::move(response), true);
    return;
  }
  if (ec) {
    if (ec != boost::asio::error::operation_aborted && ec != boost::beast::error::timeout) {
      OBJSTORE_LOG_DEBUG(logger_) << "HTTP session: Failed to read request header: " << ec.message();
    }
    close();
    return;
  }

  // Reject before reading a body we are not going to accept
  if (auto rejected = handler_.check_headers(parser_->get())) {
    handler_.log_access(parser_->get(), *rejected);
    write(std::move(*rejected), true);
    return;
  }

  parser_->body_limit(handler_.max_object_size());
  stream_.expires_after(kReadTimeout);
  beast_http::async_read(stream_, buffer_, *parser_,
    [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
      self->on_body(ec, bytes);
    });
}

void HttpSession::on_body(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::body_limit) {
    // Body only partially read, the connection cannot be reused
    Response response = handler_.payload_too_large(parser_->get());
    handler_.log_access(parser_->get(), response);
    write(std::move(response), true);
    return;
  }
  if (ec) {
    OBJSTORE_LOG_DEBUG(logger_) << "HTTP session: Failed to read request body: " << ec.message();
    close();
    return;
  }

  Request request = parser_->release();
  Response response = handler_.handle(request);
  const bool close_after = !response.keep_alive();
  write(std::move(response), close_after);
}


//==============================================
// SESSION: OUTGOING RESPONSE PROCESSING
//==============================================

void HttpSession::write(Response response, bool close_after) {
  if (close_after) {
    response.keep_alive(false);
  }
  response_ = std::make_shared<Response>(std::move(response));

  stream_.expires_after(kWriteTimeout);
  beast_http::async_write(stream_, *response_,
    [self = shared_from_this(), close_after](const boost::system::error_code& ec, std::size_t bytes) {
      self->on_write(close_after, ec, bytes);
    });
}

void HttpSession::on_write(bool close_after, const boost::system::error_code& ec,
                           std::size_t /*bytes_transferred*/) {
  response_.reset();
  if (ec) {
    OBJSTORE_LOG_DEBUG(logger_) << "HTTP session: Failed to write response: " << ec.message();
    close();
    return;
  }
  if (close_after) {
    linger();
    return;
  }
  read_header();
}


//==============================================
// SESSION: TEARDOWN
//==============================================

void HttpSession::linger() {
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec) {
    close();
    return;
  }
  stream_.expires_after(kLingerTimeout);
  drain();
}

void HttpSession::drain() {
  buffer_.consume(buffer_.size());
  stream_.async_read_some(buffer_.prepare(4096),
    [self = shared_from_this()](const boost::system::error_code& ec, std::size_t /*bytes*/) {
      if (ec) {
        self->close();
        return;
      }
      self->drain();
    });
}

void HttpSession::close() {
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  stream_.socket().close(ec);
}


//==============================================
// SERVER: CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(std::uint16_t port, const std::string& address, RequestHandler& handler,
                       logging::Logger& logger, std::size_t workers)
  : port_(port)
  , address_(address)
  , workers_(workers == 0 ? 1 : workers)
  , handler_(handler)
  , logger_(logger) {
  OBJSTORE_LOG_INFO(logger_) << "HTTP server: Initializing on " << address_ << ":" << port_
                             << " with " << workers_ << " workers";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// SERVER: INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    OBJSTORE_LOG_WARN(logger_) << "HTTP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    io_context_.restart();
    work_guard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));

    // Start accepting connections
    start_accept();

    for (std::size_t i = 0; i < workers_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_.run();
        } catch (const std::exception& e) {
          OBJSTORE_LOG_ERROR(logger_) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    OBJSTORE_LOG_INFO(logger_) << "HTTP server: Listening at " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    OBJSTORE_LOG_ERROR(logger_) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    acceptor_.reset();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own strand
  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        std::make_shared<HttpSession>(std::move(socket), handler_, logger_)->run();
      } else if (error != boost::asio::error::operation_aborted) {
        OBJSTORE_LOG_ERROR(logger_) << "HTTP server: Accept error: " << error.message();
      }
      if (error != boost::asio::error::operation_aborted) {
        start_accept();  // Continue accepting new connections
      }
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  OBJSTORE_LOG_INFO(logger_) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      OBJSTORE_LOG_ERROR(logger_) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  work_guard_.reset();
  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  OBJSTORE_LOG_INFO(logger_) << "HTTP server: Server shutdown complete";
}

} // namespace objstore::http
