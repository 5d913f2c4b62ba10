#include <gtest/gtest.h>
#include <string>
#include "http/request_handler.hpp"
#include "test_utils.hpp"

using namespace objstore;
using namespace objstore::http;

class RequestHandlerTest : public ::testing::Test {
protected:
  logging::Logger logger;
  store::ObjectStore object_store{std::in_place_type<store::MemoryStore>};
  RequestHandler handler{object_store, logger, 16};

  void SetUp() override {
    test::init_test_logging();
  }

  static Request make_request(beast_http::verb method, const std::string& target,
                              const std::string& body = "", const char* content_type = nullptr) {
    Request request{method, target, 11};
    if (content_type) {
      request.set(beast_http::field::content_type, content_type);
    }
    if (method == beast_http::verb::put) {
      request.body() = body;
      request.prepare_payload();
    }
    return request;
  }

  Response put(const std::string& target, const std::string& body, const char* content_type = "text/plain") {
    return handler.handle(make_request(beast_http::verb::put, target, body, content_type));
  }

  Response get(const std::string& target) {
    return handler.handle(make_request(beast_http::verb::get, target));
  }

  Response del(const std::string& target) {
    return handler.handle(make_request(beast_http::verb::delete_, target));
  }
};

TEST_F(RequestHandlerTest, PutCreatesThenReplaces) {
  auto created = put("/objects/b1/o1", "hello");
  EXPECT_EQ(created.result(), beast_http::status::created);
  EXPECT_EQ(created.body(), "{\"id\":\"o1\"}");
  EXPECT_EQ(created[beast_http::field::content_type], "application/json");

  auto replaced = put("/objects/b1/o1", "hello2");
  EXPECT_EQ(replaced.result(), beast_http::status::ok);
  EXPECT_EQ(replaced.body(), "{\"id\":\"o1\"}");
}

TEST_F(RequestHandlerTest, GetReturnsPayload) {
  put("/objects/b1/o1", "hello");

  auto found = get("/objects/b1/o1");
  EXPECT_EQ(found.result(), beast_http::status::ok);
  EXPECT_EQ(found.body(), "hello");
  EXPECT_EQ(found[beast_http::field::content_type], "text/plain");

  auto missing = get("/objects/b1/o2");
  EXPECT_EQ(missing.result(), beast_http::status::not_found);
  EXPECT_EQ(missing.body(), "Object b1/o2 not found\n");
}

TEST_F(RequestHandlerTest, DeleteReportsWhetherObjectExisted) {
  put("/objects/b1/o1", "hello");

  auto deleted = del("/objects/b1/o1");
  EXPECT_EQ(deleted.result(), beast_http::status::ok);
  EXPECT_TRUE(deleted.body().empty());

  auto again = del("/objects/b1/o1");
  EXPECT_EQ(again.result(), beast_http::status::not_found);
  EXPECT_EQ(again.body(), "Object b1/o1 not found\n");
}

TEST_F(RequestHandlerTest, PutRequiresTextPlain) {
  auto json = put("/objects/b1/o1", "{}", "application/json");
  EXPECT_EQ(json.result(), beast_http::status::unsupported_media_type);
  EXPECT_EQ(json.body(), "Content type \"application/json\" not supported\n");

  auto none = put("/objects/b1/o1", "x", nullptr);
  EXPECT_EQ(none.result(), beast_http::status::unsupported_media_type);

  EXPECT_FALSE(object_store.retrieve("o1", "b1").has_value());
}

TEST_F(RequestHandlerTest, PutWithoutBodyIsBadRequest) {
  Request request{beast_http::verb::put, "/objects/b1/o1", 11};
  request.set(beast_http::field::content_type, "text/plain");

  auto response = handler.handle(request);
  EXPECT_EQ(response.result(), beast_http::status::bad_request);
  EXPECT_EQ(response.body(), "Object content not set\n");
}

TEST_F(RequestHandlerTest, EmptyBodyIsAValidObject) {
  auto response = put("/objects/b1/empty", "");
  EXPECT_EQ(response.result(), beast_http::status::created);
  EXPECT_EQ(object_store.retrieve("empty", "b1"), std::optional<std::string>(""));
}

TEST_F(RequestHandlerTest, OversizedPutIsRejected) {
  auto at_limit = put("/objects/b1/o1", std::string(16, 'x'));
  EXPECT_EQ(at_limit.result(), beast_http::status::created);

  auto over = put("/objects/b1/o2", std::string(17, 'x'));
  EXPECT_EQ(over.result(), beast_http::status::payload_too_large);
  EXPECT_EQ(over.body(), "Object size exceeds maximum size of 16 Bytes\n");
  EXPECT_FALSE(object_store.retrieve("o2", "b1").has_value());
}

TEST_F(RequestHandlerTest, CheckHeadersRejectsBeforeBody) {
  Request request{beast_http::verb::put, "/objects/b1/o1", 11};
  request.set(beast_http::field::content_type, "text/plain");
  request.content_length(1000);
  auto rejected = handler.check_headers(request);
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->result(), beast_http::status::payload_too_large);

  request.content_length(10);
  EXPECT_FALSE(handler.check_headers(request).has_value());

  Request get_request{beast_http::verb::get, "/objects/b1/o1", 11};
  EXPECT_FALSE(handler.check_headers(get_request).has_value());
}

TEST_F(RequestHandlerTest, UnknownRoutesAreNotFound) {
  for (const auto* target : {"/", "/objects", "/objects/b1", "/objects/b1/", "/objects/B1/o1",
                             "/objects/b1/o.1", "/objects/b1/o1/extra", "/other/b1/o1"}) {
    auto response = get(target);
    EXPECT_EQ(response.result(), beast_http::status::not_found) << target;
    EXPECT_EQ(response.body(), "404 page not found\n") << target;
  }
}

TEST_F(RequestHandlerTest, OtherMethodsAreNotAllowed) {
  auto response = handler.handle(make_request(beast_http::verb::post, "/objects/b1/o1"));
  EXPECT_EQ(response.result(), beast_http::status::method_not_allowed);
}

TEST_F(RequestHandlerTest, QueryStringIsIgnored) {
  put("/objects/b1/o1?version=2", "hello");
  EXPECT_EQ(get("/objects/b1/o1").body(), "hello");
}

TEST_F(RequestHandlerTest, KeepAliveFollowsRequest) {
  auto request = make_request(beast_http::verb::get, "/objects/b1/o1");
  request.keep_alive(false);
  EXPECT_FALSE(handler.handle(request).keep_alive());

  request.keep_alive(true);
  EXPECT_TRUE(handler.handle(request).keep_alive());
}

TEST(RequestHandlerRouteTest, MatchesObjectRoutes) {
  auto route = RequestHandler::match_route("/objects/my-bucket/obj_1");
  ASSERT_TRUE(route.has_value());
  EXPECT_EQ(route->bucket_id, "my-bucket");
  EXPECT_EQ(route->object_id, "obj_1");

  EXPECT_FALSE(RequestHandler::match_route("/objects//o1").has_value());
  EXPECT_FALSE(RequestHandler::match_route("/objects/b1/").has_value());
}

TEST(RequestHandlerRouteTest, FormatsSizesInBinaryUnits) {
  EXPECT_EQ(RequestHandler::format_size_binary(0), "0 Bytes");
  EXPECT_EQ(RequestHandler::format_size_binary(1023), "1023 Bytes");
  EXPECT_EQ(RequestHandler::format_size_binary(1024), "1.0 KiB");
  EXPECT_EQ(RequestHandler::format_size_binary(1536), "1.5 KiB");
  EXPECT_EQ(RequestHandler::format_size_binary(10 << 20), "10.0 MiB");
  EXPECT_EQ(RequestHandler::format_size_binary(std::uint64_t{3} << 30), "3.0 GiB");
}
