#include "http/request_handler.hpp"
#include "store/record_codec.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdio>
#include <sstream>

namespace objstore::http {

namespace {

std::string_view to_std(boost::beast::string_view view) {
  return std::string_view(view.data(), view.size());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::ObjectStore& store, logging::Logger& logger,
                               std::uint64_t max_object_size)
  : store_(store)
  , logger_(logger)
  , max_object_size_(max_object_size) {
  OBJSTORE_LOG_DEBUG(logger_) << "Request handler: Serving objects from the " << store_.backend_name()
                              << " store, max object size " << format_size_binary(max_object_size_);
}


//==============================================
// REQUEST PROCESSING
//==============================================

Response RequestHandler::handle(const Request& request) {
  Response response = dispatch(request);
  log_access(request, response);
  return response;
}

std::optional<Response> RequestHandler::check_headers(const Request& request) const {
  if (request.method() != beast_http::verb::put || !match_route(to_std(request.target()))) {
    return std::nullopt;
  }

  const auto content_type = to_std(request[beast_http::field::content_type]);
  if (content_type != "text/plain") {
    return make_error(request, beast_http::status::unsupported_media_type,
                      "Content type \"" + std::string(content_type) + "\" not supported");
  }

  if (!request.has_content_length() && !request.chunked()) {
    return make_error(request, beast_http::status::bad_request, "Object content not set");
  }

  if (request.has_content_length()) {
    const auto declared = to_std(request[beast_http::field::content_length]);
    std::uint64_t length = 0;
    std::istringstream(std::string(declared)) >> length;
    if (length > max_object_size_) {
      return payload_too_large(request);
    }
  }
  return std::nullopt;
}


//==============================================
// ROUTING
//==============================================

std::optional<Route> RequestHandler::match_route(std::string_view target) {
  const auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }

  if (target.substr(0, kObjectsPrefix.size()) != kObjectsPrefix) {
    return std::nullopt;
  }
  target.remove_prefix(kObjectsPrefix.size());

  const auto slash = target.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }

  Route route{std::string(target.substr(0, slash)), std::string(target.substr(slash + 1))};
  if (!store::RecordCodec::is_valid_identifier(route.bucket_id) ||
      !store::RecordCodec::is_valid_identifier(route.object_id)) {
    return std::nullopt;
  }
  return route;
}

std::string RequestHandler::format_size_binary(std::uint64_t bytes) {
  constexpr std::uint64_t unit = 1024;
  if (bytes < unit) {
    return std::to_string(bytes) + " Bytes";
  }

  std::uint64_t div = unit;
  int exp = 0;
  for (std::uint64_t n = bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    ++exp;
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f %ciB",
                static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
  return buffer;
}


//==============================================
// ROUTE HANDLERS
//==============================================

Response RequestHandler::dispatch(const Request& request) {
  auto route = match_route(to_std(request.target()));
  if (!route) {
    return make_error(request, beast_http::status::not_found, "404 page not found");
  }

  switch (request.method()) {
    case beast_http::verb::put:
      return handle_store(request, *route);
    case beast_http::verb::get:
      return handle_retrieve(request, *route);
    case beast_http::verb::delete_:
      return handle_delete(request, *route);
    default:
      return make_error(request, beast_http::status::method_not_allowed, "Method not allowed");
  }
}

Response RequestHandler::handle_store(const Request& request, const Route& route) {
  if (auto rejected = check_headers(request)) {
    return *rejected;
  }
  if (request.body().size() > max_object_size_) {
    return payload_too_large(request);
  }

  bool replaced = false;
  try {
    replaced = store_.store(request.body(), route.object_id, route.bucket_id);
  }
  catch (const std::exception& e) {
    OBJSTORE_LOG_ERROR(logger_) << "Request handler: Store of " << route.bucket_id << "/"
                                << route.object_id << " failed: " << e.what();
    return make_error(request, beast_http::status::internal_server_error,
                      std::string("Error storing object: ") + e.what());
  }

  boost::property_tree::ptree body;
  body.put("id", route.object_id);
  std::ostringstream json;
  boost::property_tree::write_json(json, body, false);

  std::string payload = json.str();
  if (!payload.empty() && payload.back() == '\n') {
    payload.pop_back();
  }

  return make_response(request, replaced ? beast_http::status::ok : beast_http::status::created,
                       std::move(payload), "application/json");
}

Response RequestHandler::handle_retrieve(const Request& request, const Route& route) {
  std::optional<std::string> object;
  try {
    object = store_.retrieve(route.object_id, route.bucket_id);
  }
  catch (const std::exception& e) {
    OBJSTORE_LOG_ERROR(logger_) << "Request handler: Retrieve of " << route.bucket_id << "/"
                                << route.object_id << " failed: " << e.what();
    return make_error(request, beast_http::status::internal_server_error,
                      std::string("Error retrieving object: ") + e.what());
  }

  if (!object) {
    return make_error(request, beast_http::status::not_found,
                      "Object " + route.bucket_id + "/" + route.object_id + " not found");
  }
  return make_response(request, beast_http::status::ok, std::move(*object), "text/plain");
}

Response RequestHandler::handle_delete(const Request& request, const Route& route) {
  bool deleted = false;
  try {
    deleted = store_.remove(route.object_id, route.bucket_id);
  }
  catch (const std::exception& e) {
    OBJSTORE_LOG_ERROR(logger_) << "Request handler: Delete of " << route.bucket_id << "/"
                                << route.object_id << " failed: " << e.what();
    return make_error(request, beast_http::status::internal_server_error,
                      std::string("Error deleting object: ") + e.what());
  }

  if (!deleted) {
    return make_error(request, beast_http::status::not_found,
                      "Object " + route.bucket_id + "/" + route.object_id + " not found");
  }
  return make_response(request, beast_http::status::ok, "", nullptr);
}


//==============================================
// RESPONSE HELPERS
//==============================================

Response RequestHandler::make_response(const Request& request, beast_http::status status,
                                       std::string body, const char* content_type) {
  Response response{status, request.version()};
  if (content_type) {
    response.set(beast_http::field::content_type, content_type);
  }
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

Response RequestHandler::make_error(const Request& request, beast_http::status status,
                                    const std::string& message) {
  return make_response(request, status, message + "\n", "text/plain; charset=utf-8");
}

Response RequestHandler::payload_too_large(const Request& request) const {
  return make_error(request, beast_http::status::payload_too_large,
                    "Object size exceeds maximum size of " + format_size_binary(max_object_size_));
}

void RequestHandler::log_access(const Request& request, const Response& response) {
  const auto status = response.result_int();
  if (status >= 400) {
    OBJSTORE_LOG_WARN(logger_) << request.method_string() << " " << request.target() << " " << status;
  } else {
    OBJSTORE_LOG_DEBUG(logger_) << request.method_string() << " " << request.target() << " " << status;
  }
}

} // namespace objstore::http
