#ifndef OBJSTORE_HTTP_REQUEST_HANDLER_HPP
#define OBJSTORE_HTTP_REQUEST_HANDLER_HPP

#include <boost/beast/http.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/object_store.hpp"

namespace objstore::http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

// Path prefix every object route lives under
constexpr std::string_view kObjectsPrefix = "/objects/";

// Bucket and object named by /objects/{bucket}/{objectId}
struct Route {
  std::string bucket_id;
  std::string object_id;
};

// Maps HTTP requests onto the storage capability and storage results onto
// status codes. Knows nothing about sockets.
class RequestHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RequestHandler(store::ObjectStore& store, logging::Logger& logger,
                 std::uint64_t max_object_size = config::kDefaultMaxObjectSize);


  // ---- REQUEST PROCESSING ----
  // Produces the response for a fully read request and logs the outcome
  Response handle(const Request& request);
  // Checks a PUT whose body has not been read yet. Returns the error
  // response to send instead of reading the body, or nullopt to go on.
  std::optional<Response> check_headers(const Request& request) const;
  // Response for a body that outgrew the limit while being read
  Response payload_too_large(const Request& request) const;
  // Access log line, warning level from 400 upwards
  void log_access(const Request& request, const Response& response);


  // ---- GETTERS ----
  std::uint64_t max_object_size() const { return max_object_size_; }


  // ---- ROUTING ----
  // Matches /objects/{bucket}/{objectId}, ignoring any query string
  static std::optional<Route> match_route(std::string_view target);
  // "512 Bytes", "10.0 MiB"
  static std::string format_size_binary(std::uint64_t bytes);

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;
  logging::Logger& logger_;
  const std::uint64_t max_object_size_;


  // ---- ROUTE HANDLERS ----
  Response dispatch(const Request& request);
  Response handle_store(const Request& request, const Route& route);
  Response handle_retrieve(const Request& request, const Route& route);
  Response handle_delete(const Request& request, const Route& route);


  // ---- RESPONSE HELPERS ----
  static Response make_response(const Request& request, beast_http::status status,
                                std::string body, const char* content_type);
  static Response make_error(const Request& request, beast_http::status status, const std::string& message);
};

} // namespace objstore::http

#endif // OBJSTORE_HTTP_REQUEST_HANDLER_HPP
