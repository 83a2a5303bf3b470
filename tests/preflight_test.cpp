#include "preflight.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace cors {
namespace {

class PreflightResponderTest : public ::testing::Test {
protected:
    origin_list origins = origin_list::parse("http://localhost:3000,https://example.com");
    preflight_responder responder{origins, preflight_spec{}};
    http::response response;
};

TEST_F(PreflightResponderTest, RecognizesPreflight) {
    EXPECT_TRUE(preflight_responder::is_preflight(test::preflight("https://example.com")));
    EXPECT_FALSE(preflight_responder::is_preflight(test::make_request("OPTIONS", "/chatbox/healthz")));
    EXPECT_FALSE(preflight_responder::is_preflight(
        test::make_request("GET", "/chatbox/healthz", {{"Access-Control-Request-Method", "GET"}})));
    EXPECT_FALSE(preflight_responder::is_preflight(
        test::make_request("OPTIONS", "/chatbox/healthz", {{"Access-Control-Request-Method", ""}})));
}

TEST_F(PreflightResponderTest, AllowedOriginGetsAllFiveHeaders) {
    const auto req = test::preflight("http://localhost:3000", "POST");
    ASSERT_TRUE(responder.respond(req, response));

    EXPECT_TRUE(response.is_finalized());
    EXPECT_EQ(response.status_code(), http::status::no_content);
    EXPECT_TRUE(response.get_body().empty());

    EXPECT_EQ(response.get_headers().size(), 5U);
    EXPECT_EQ(response.get_header(header::allow_origin), "http://localhost:3000");
    EXPECT_EQ(response.get_header(header::allow_methods), "GET, POST, PUT, PATCH, DELETE, OPTIONS");
    EXPECT_EQ(response.get_header(header::allow_headers), "Origin, Content-Type, Accept, Authorization");
    EXPECT_EQ(response.get_header(header::allow_credentials), "true");
    EXPECT_EQ(response.get_header(header::max_age), "43200");
}

TEST_F(PreflightResponderTest, DisallowedOriginGets204WithoutCorsHeaders) {
    ASSERT_TRUE(responder.respond(test::preflight("http://evil.example"), response));
    EXPECT_EQ(response.status_code(), http::status::no_content);
    EXPECT_TRUE(response.get_headers().empty());
}

TEST_F(PreflightResponderTest, PlainOptionsIsLeftToTheApplication) {
    const auto req = test::make_request("OPTIONS", "/chatbox/healthz", {{"Origin", "http://localhost:3000"}});
    EXPECT_FALSE(responder.respond(req, response));
    EXPECT_FALSE(response.is_finalized());
    EXPECT_TRUE(response.get_headers().empty());
}

TEST_F(PreflightResponderTest, RequestedHeadersAreNotEchoed) {
    const auto req = test::make_request("OPTIONS", "/chatbox/messages",
                                        {{"Origin", "https://example.com"},
                                         {"Access-Control-Request-Method", "PUT"},
                                         {"Access-Control-Request-Headers", "X-Custom, Content-Type"}});
    ASSERT_TRUE(responder.respond(req, response));
    EXPECT_EQ(response.get_header(header::allow_headers), "Origin, Content-Type, Accept, Authorization");
}

TEST(PreflightSpecTest, CredentialsOffOmitsHeader) {
    const auto origins = origin_list::parse("https://example.com");
    preflight_spec spec;
    spec.allow_credentials = false;
    const preflight_responder responder{origins, spec};

    http::response response;
    ASSERT_TRUE(responder.respond(test::preflight("https://example.com"), response));
    EXPECT_EQ(response.get_headers().size(), 4U);
    EXPECT_FALSE(response.get_header(header::allow_credentials).has_value());
}

TEST(PreflightSpecTest, WildcardWithoutCredentialsAnswersStar) {
    const auto origins = origin_list::any();
    preflight_spec spec;
    spec.allow_credentials = false;
    const preflight_responder responder{origins, spec};

    http::response response;
    ASSERT_TRUE(responder.respond(test::preflight("https://anywhere.example"), response));
    EXPECT_EQ(response.get_header(header::allow_origin), "*");
}

TEST(PreflightSpecTest, DefaultsMatchServiceConfiguration) {
    const preflight_spec spec;
    EXPECT_EQ(spec.max_age, std::chrono::seconds{43200});
    EXPECT_TRUE(spec.allow_credentials);
    EXPECT_EQ(spec.allowed_methods.size(), 6U);
    EXPECT_EQ(spec.allowed_headers.size(), 4U);
}

} // namespace
} // namespace cors
