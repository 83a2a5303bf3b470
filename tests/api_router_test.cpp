#include "api_router.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace {

void ok_handler(const http::request&, http::response& res) {
    res.set_body(http::status::ok, R"({"status":"ok"})");
}

TEST(ApiRouterTest, FindsRegisteredEndpoint) {
    api_router router;
    router.register_api(webapi_path{"/chatbox/healthz"}, http::method::get, &ok_handler);

    const auto lookup = router.find("/chatbox/healthz", http::method::get);
    const auto* endpoint = std::get_if<const api_router::endpoint*>(&lookup);
    ASSERT_NE(endpoint, nullptr);
    EXPECT_EQ((*endpoint)->method, http::method::get);

    http::response res;
    (*endpoint)->handler(test::make_request("GET", "/chatbox/healthz"), res);
    EXPECT_EQ(res.status_code(), http::status::ok);
}

TEST(ApiRouterTest, UnknownPathIsNotFound) {
    api_router router;
    router.register_api(webapi_path{"/chatbox/healthz"}, http::method::get, &ok_handler);
    EXPECT_TRUE(std::holds_alternative<api_router::not_found>(router.find("/chatbox/missing", http::method::get)));
    EXPECT_TRUE(std::holds_alternative<api_router::not_found>(router.find("/chatbox/healthz/", http::method::get)));
}

TEST(ApiRouterTest, WrongMethodListsAllowedMethods) {
    api_router router;
    router.register_api(webapi_path{"/chatbox/messages"}, http::method::get, &ok_handler);
    router.register_api(webapi_path{"/chatbox/messages"}, http::method::post, &ok_handler);

    const auto lookup = router.find("/chatbox/messages", http::method::delete_);
    const auto* mismatch = std::get_if<api_router::method_mismatch>(&lookup);
    ASSERT_NE(mismatch, nullptr);
    EXPECT_EQ(mismatch->allow, "GET, POST");
}

TEST(ApiRouterTest, ReRegistrationReplacesHandler) {
    api_router router;
    router.register_api(webapi_path{"/chatbox/readyz"}, http::method::get, &ok_handler);
    router.register_api(webapi_path{"/chatbox/readyz"}, http::method::get,
                        [](const http::request&, http::response& res) { res.set_body(http::status::service_unavailable, "{}"); });
    EXPECT_EQ(router.size(), 1U);

    const auto lookup = router.find("/chatbox/readyz", http::method::get);
    http::response res;
    std::get<const api_router::endpoint*>(lookup)->handler(test::make_request("GET", "/chatbox/readyz"), res);
    EXPECT_EQ(res.status_code(), http::status::service_unavailable);
}

TEST(WebApiPathTest, KeepsPath) {
    constexpr webapi_path path{"/chatbox/healthz"};
    static_assert(path.get() == "/chatbox/healthz");
    EXPECT_EQ(path.get(), "/chatbox/healthz");
}

} // namespace
