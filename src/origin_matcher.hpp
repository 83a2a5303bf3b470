#ifndef ORIGIN_MATCHER_HPP
#define ORIGIN_MATCHER_HPP

#include "origin_list.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace cors {

/**
 * @struct decision
 * @brief The per-request CORS verdict. Lives on the stack of the request.
 */
struct decision {
    bool allowed{false};
    // Value for Access-Control-Allow-Origin, set only when allowed.
    std::optional<std::string> allow_origin;
    bool allow_credentials{false};
    // True when allow_origin depends on the request's Origin (caches must Vary on it).
    bool vary_origin{false};

    bool operator==(const decision&) const = default;
};

/**
 * @brief Decides whether a request origin may read the response.
 *
 * An empty origin is the normal same-origin/non-browser path: not allowed,
 * no headers, not an error. A wildcard list echoes the request origin when
 * credentials are allowed (a literal "*" is invalid with credentials) and
 * "*" otherwise.
 *
 * @param origin The value of the request's Origin header.
 * @param list The configured allow-list.
 * @param allow_credentials Whether Access-Control-Allow-Credentials is sent.
 */
[[nodiscard]] inline decision match(std::string_view origin, const origin_list& list, bool allow_credentials) {
    if (list.is_disabled() || origin.empty()) {
        return {};
    }

    if (list.allows_any()) {
        if (allow_credentials) {
            return {true, std::string(origin), true, true};
        }
        return {true, std::string("*"), false, false};
    }

    if (!list.contains(origin)) {
        return {};
    }
    return {true, std::string(origin), allow_credentials, true};
}

} // namespace cors

#endif // ORIGIN_MATCHER_HPP
