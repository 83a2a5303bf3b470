#include "cors_policy.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace cors {
namespace {

constexpr std::string_view k_origins = "http://localhost:3000,https://example.com";

class CorsPolicyTest : public ::testing::Test {
protected:
    policy cors{origin_list::parse(k_origins)};
    http::response response;
    int handler_calls{0};

    handler counting_handler() {
        return [this](const http::request&, http::response& res) {
            ++handler_calls;
            res.set_body(http::status::ok, R"({"status":"ok"})");
        };
    }
};

TEST_F(CorsPolicyTest, AllowedOriginGetsCorsHeaders) {
    const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", "https://example.com"}});
    EXPECT_EQ(cors.intercept(req, response), result::allowed);
    EXPECT_FALSE(response.is_finalized());
    EXPECT_EQ(response.get_header(header::allow_origin), "https://example.com");
    EXPECT_EQ(response.get_header(header::allow_credentials), "true");
    EXPECT_EQ(response.get_header(header::expose_headers), "Content-Length");
    EXPECT_EQ(response.get_header(header::vary), "Origin");
    EXPECT_FALSE(response.get_header(header::allow_methods).has_value());
    EXPECT_FALSE(response.get_header(header::max_age).has_value());
}

TEST_F(CorsPolicyTest, VaryIsAppendedToExistingValue) {
    response.set_header("Vary", "Accept-Encoding");
    const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", "http://localhost:3000"}});
    EXPECT_EQ(cors.intercept(req, response), result::allowed);
    EXPECT_EQ(response.get_header(header::vary), "Accept-Encoding, Origin");
}

TEST_F(CorsPolicyTest, DeniedOriginIsServedWithoutCorsHeaders) {
    const auto wrapped = cors.wrap(counting_handler());
    const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", "http://evil.example"}});
    wrapped(req, response);

    EXPECT_EQ(handler_calls, 1);
    EXPECT_EQ(response.status_code(), http::status::ok);
    EXPECT_FALSE(response.get_header(header::allow_origin).has_value());
    EXPECT_FALSE(response.get_header(header::allow_credentials).has_value());
}

TEST_F(CorsPolicyTest, MissingOriginIsNotCors) {
    const auto req = test::make_request("GET", "/chatbox/healthz");
    EXPECT_EQ(cors.handle(req, response, counting_handler()), result::not_cors);
    EXPECT_EQ(handler_calls, 1);
    EXPECT_TRUE(response.get_headers().empty());
}

TEST_F(CorsPolicyTest, PreflightShortCircuitsHandler) {
    const auto wrapped = cors.wrap(counting_handler());
    wrapped(test::preflight("http://localhost:3000"), response);

    EXPECT_EQ(handler_calls, 0);
    EXPECT_EQ(response.status_code(), http::status::no_content);
    EXPECT_EQ(response.get_headers().size(), 5U);
    EXPECT_EQ(response.get_header(header::max_age), "43200");
}

TEST_F(CorsPolicyTest, DeniedPreflightStillShortCircuits) {
    EXPECT_EQ(cors.handle(test::preflight("http://evil.example"), response, counting_handler()), result::preflight_answered);
    EXPECT_EQ(handler_calls, 0);
    EXPECT_EQ(response.status_code(), http::status::no_content);
    EXPECT_TRUE(response.get_headers().empty());
}

TEST_F(CorsPolicyTest, PlainOptionsReachesHandler) {
    const auto req = test::make_request("OPTIONS", "/chatbox/healthz", {{"Origin", "http://localhost:3000"}});
    EXPECT_EQ(cors.handle(req, response, counting_handler()), result::allowed);
    EXPECT_EQ(handler_calls, 1);
    EXPECT_EQ(response.get_header(header::allow_origin), "http://localhost:3000");
}

TEST_F(CorsPolicyTest, Accessors) {
    EXPECT_TRUE(cors.enabled());
    EXPECT_EQ(cors.origins(), origin_list::parse(k_origins));
    EXPECT_TRUE(cors.spec().allow_credentials);
    EXPECT_EQ(cors.spec().max_age, std::chrono::hours{12});
}

TEST(CorsPolicyDisabledTest, EmptyConfigurationIsInert) {
    const policy cors{origin_list::parse("")};
    EXPECT_FALSE(cors.enabled());

    for (const auto* origin : {"http://localhost:3000", "*", "https://example.com"}) {
        http::response response;
        const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", origin}});
        EXPECT_EQ(cors.intercept(req, response), result::disabled);
        EXPECT_TRUE(response.get_headers().empty()) << origin;
    }

    // Preflights reach the application too.
    int calls = 0;
    http::response response;
    cors.handle(test::preflight("http://localhost:3000"), response,
                [&calls](const http::request&, http::response&) { ++calls; });
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(response.is_finalized());
}

TEST(CorsPolicyWildcardTest, CredentialedWildcardEchoesOrigin) {
    const policy cors{origin_list::parse("*")};
    http::response response;
    const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", "https://anywhere.example"}});
    EXPECT_EQ(cors.intercept(req, response), result::allowed);
    EXPECT_EQ(response.get_header(header::allow_origin), "https://anywhere.example");
    EXPECT_EQ(response.get_header(header::vary), "Origin");
}

TEST(CorsPolicyWildcardTest, UncredentialedWildcardSendsStarWithoutVary) {
    preflight_spec spec;
    spec.allow_credentials = false;
    const policy cors{origin_list::any(), spec};
    http::response response;
    const auto req = test::make_request("GET", "/chatbox/healthz", {{"Origin", "https://anywhere.example"}});
    EXPECT_EQ(cors.intercept(req, response), result::allowed);
    EXPECT_EQ(response.get_header(header::allow_origin), "*");
    EXPECT_FALSE(response.get_header(header::allow_credentials).has_value());
    EXPECT_FALSE(response.get_header(header::vary).has_value());
}

TEST(CorsPolicyDescribeTest, NamesTheMode) {
    EXPECT_EQ(policy{origin_list{}}.describe(), "CORS disabled (no allowed origins configured)");
    EXPECT_TRUE(policy{origin_list::any()}.describe().starts_with("CORS enabled for any origin"));
    EXPECT_TRUE(policy{origin_list::parse(k_origins)}.describe().contains("2 origin(s)"));
}

TEST(CorsResultTest, NamesAreStable) {
    EXPECT_EQ(to_string(result::disabled), "disabled");
    EXPECT_EQ(to_string(result::not_cors), "not_cors");
    EXPECT_EQ(to_string(result::allowed), "allowed");
    EXPECT_EQ(to_string(result::denied), "denied");
    EXPECT_EQ(to_string(result::preflight_answered), "preflight_answered");
    static_assert(to_string(result::allowed) == "allowed");
}

TEST(CorsPolicyConcurrencyTest, SharedPolicyGivesIndependentDecisions) {
    const policy cors{origin_list::parse(k_origins)};
    const std::vector<std::string> origins{"http://localhost:3000", "https://example.com", "http://evil.example", ""};

    // Requests are built up front; the parser is exercised elsewhere.
    std::vector<http::request> requests;
    for (const auto& origin : origins) {
        requests.push_back(origin.empty() ? test::make_request("GET", "/chatbox/healthz")
                                          : test::make_request("GET", "/chatbox/healthz", {{"Origin", origin}}));
    }

    std::atomic<int> mismatches{0};
    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 500; ++i) {
                const size_t idx = static_cast<size_t>(t + i) % requests.size();
                http::response response;
                const auto outcome = cors.intercept(requests[idx], response);
                const auto echoed = response.get_header(header::allow_origin);
                const bool ok = (idx < 2) ? (outcome == result::allowed && echoed == origins[idx])
                                          : !echoed.has_value();
                if (!ok) {
                    ++mismatches;
                }
            }
        });
    }
    threads.clear();
    EXPECT_EQ(mismatches.load(), 0);
}

} // namespace
} // namespace cors
