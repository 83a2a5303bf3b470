#ifndef CORS_POLICY_HPP
#define CORS_POLICY_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "origin_list.hpp"
#include "origin_matcher.hpp"
#include "preflight.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace cors {

// The request handling signature the policy wraps.
using handler = std::function<void(const http::request&, http::response&)>;

/**
 * @brief What intercept() did with a request.
 */
enum class result {
    disabled,           // no origins configured, policy is inert
    not_cors,           // no Origin header
    allowed,            // CORS headers attached, continue to the handler
    denied,             // origin not allowed, continue without CORS headers
    preflight_answered  // response is final, the handler must not run
};

[[nodiscard]] constexpr std::string_view to_string(result r) noexcept {
    switch (r) {
        case result::disabled: return "disabled";
        case result::not_cors: return "not_cors";
        case result::allowed: return "allowed";
        case result::denied: return "denied";
        case result::preflight_answered: return "preflight_answered";
    }
    return "unknown";
}

/**
 * @class policy
 * @brief CORS admission layer placed in front of every route.
 *
 * Built once at startup from the configured origin list and shared read-only
 * by all I/O and worker threads; it has no mutable state.
 *
 * A denied origin is not an HTTP error: the request is served normally and
 * the browser withholds the response from the calling script.
 *
 * @par Example
 * @code
 * cors::policy cors{cors::origin_list::parse("http://localhost:3000")};
 * cors::handler h = cors.wrap([](const http::request&, http::response& res) {
 *     res.set_body(http::status::ok, R"({"status":"ok"})");
 * });
 * @endcode
 */
class policy {
public:
    explicit policy(origin_list origins, preflight_spec spec = {});

    // The preflight responder refers to m_origins.
    policy(const policy&) = delete;
    policy& operator=(const policy&) = delete;
    policy(policy&&) = delete;
    policy& operator=(policy&&) = delete;

    /**
     * @brief Request interceptor, run before route dispatch.
     *
     * Answers preflights (result::preflight_answered, res is final) and
     * otherwise attaches the CORS headers a later set_body() will emit.
     */
    [[nodiscard]] result intercept(const http::request& req, http::response& res) const;

    /**
     * @brief Runs intercept() and, unless it short-circuited, next.
     */
    result handle(const http::request& req, http::response& res, const handler& next) const;

    /**
     * @brief Wrapping combinator: returns a handler that applies this policy
     * before calling next. The policy must outlive the returned handler.
     */
    [[nodiscard]] handler wrap(handler next) const;

    [[nodiscard]] bool enabled() const noexcept { return !m_origins.is_disabled(); }
    [[nodiscard]] const origin_list& origins() const noexcept { return m_origins; }
    [[nodiscard]] const preflight_spec& spec() const noexcept { return m_preflight.spec(); }

    // One-line description of the active configuration for the startup log.
    [[nodiscard]] std::string describe() const;

private:
    origin_list m_origins;
    preflight_responder m_preflight;
    std::string m_expose_headers;
};

} // namespace cors

#endif // CORS_POLICY_HPP
