#ifndef PREFLIGHT_HPP
#define PREFLIGHT_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "origin_matcher.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace cors {

namespace header {
    inline constexpr std::string_view origin = "Origin";
    inline constexpr std::string_view request_method = "Access-Control-Request-Method";
    inline constexpr std::string_view request_headers = "Access-Control-Request-Headers";
    inline constexpr std::string_view allow_origin = "Access-Control-Allow-Origin";
    inline constexpr std::string_view allow_methods = "Access-Control-Allow-Methods";
    inline constexpr std::string_view allow_headers = "Access-Control-Allow-Headers";
    inline constexpr std::string_view allow_credentials = "Access-Control-Allow-Credentials";
    inline constexpr std::string_view expose_headers = "Access-Control-Expose-Headers";
    inline constexpr std::string_view max_age = "Access-Control-Max-Age";
    inline constexpr std::string_view vary = "Vary";
}

/**
 * @struct preflight_spec
 * @brief What the server advertises in answer to a preflight. Fixed when the
 * policy is built.
 */
struct preflight_spec {
    std::vector<std::string> allowed_methods{"GET", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"};
    std::vector<std::string> allowed_headers{"Origin", "Content-Type", "Accept", "Authorization"};
    // Sent on actual (non-preflight) responses only.
    std::vector<std::string> exposed_headers{"Content-Length"};
    bool allow_credentials{true};
    std::chrono::seconds max_age{std::chrono::hours{12}};
};

/**
 * @class preflight_responder
 * @brief Answers CORS preflight requests on behalf of the application.
 *
 * Holds the header values pre-joined so answering a preflight does no
 * formatting beyond copying strings.
 */
class preflight_responder {
public:
    preflight_responder(const origin_list& origins, preflight_spec spec);

    /**
     * @brief A preflight is an OPTIONS request carrying Access-Control-Request-Method.
     * A plain OPTIONS request (health probes, capability queries) is not one.
     */
    [[nodiscard]] static bool is_preflight(const http::request& req) noexcept;

    /**
     * @brief Writes the preflight answer into res.
     *
     * A disallowed origin still gets 204, just without CORS headers, so the
     * browser blocks the real request itself.
     *
     * @return true if the request was a preflight and res is final,
     * false if the request must go on to the application (res untouched).
     */
    bool respond(const http::request& req, http::response& res) const;

    [[nodiscard]] const preflight_spec& spec() const noexcept { return m_spec; }

private:
    const origin_list& m_origins;
    preflight_spec m_spec;
    std::string m_allow_methods;
    std::string m_allow_headers;
    std::string m_max_age;
};

} // namespace cors

#endif // PREFLIGHT_HPP
