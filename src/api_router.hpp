#ifndef API_ROUTER_HPP
#define API_ROUTER_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "util.hpp"
#include <string_view>
#include <string>
#include <unordered_map>
#include <functional>
#include <stdexcept>
#include <vector>
#include <variant>
#include <algorithm>

using api_handler_func = std::function<void(const http::request&, http::response&)>;

class consteval_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @struct webapi_path
 * @brief A route path checked at compile time: absolute, no trailing '/',
 * lowercase letters, digits, '_', '-' and '/' only.
 */
struct webapi_path {
    consteval explicit webapi_path(std::string_view path) : m_path{path} {
        if (path.empty() || !path.starts_with('/')) {
            throw consteval_error("Invalid WebAPI path: must start with '/'");
        }
        if (path.length() > 1 && path.ends_with('/')) {
            throw consteval_error("Invalid WebAPI path: cannot end with '/'");
        }
        if (path.contains("//")) {
            throw consteval_error("Invalid WebAPI path: empty segment");
        }
        for (const char c : path) {
            if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '/')) {
                throw consteval_error("Invalid WebAPI path: contains an invalid character");
            }
        }
    }

    [[nodiscard]] constexpr std::string_view get() const noexcept {
        return m_path;
    }

private:
    std::string_view m_path;
};

/**
 * @class api_router
 * @brief Exact-path route catalog. A path may be registered for several
 * methods, each with its own handler.
 */
class api_router {
public:
    struct endpoint {
        http::method method;
        api_handler_func handler;
    };

    // The path exists but not for the requested method.
    struct method_mismatch {
        std::string allow; // value for the Allow header
    };

    struct not_found {};

    using lookup_result = std::variant<const endpoint*, method_mismatch, not_found>;

    /**
     * @brief Registers handler for method on path, replacing an earlier
     * registration of the same pair.
     */
    void register_api(webapi_path path, http::method method, api_handler_func handler) {
        auto& endpoints = m_routes[path.get()];
        if (auto it = std::ranges::find(endpoints, method, &endpoint::method); it != endpoints.end()) {
            it->handler = std::move(handler);
            return;
        }
        endpoints.push_back({method, std::move(handler)});
    }

    [[nodiscard]] lookup_result find(std::string_view path, http::method method) const {
        const auto route = m_routes.find(path);
        if (route == m_routes.end()) {
            return not_found{};
        }
        const auto& endpoints = route->second;
        if (auto it = std::ranges::find(endpoints, method, &endpoint::method); it != endpoints.end()) {
            return &*it;
        }
        std::vector<std::string_view> names;
        names.reserve(endpoints.size());
        for (const auto& e : endpoints) {
            names.push_back(http::to_string(e.method));
        }
        return method_mismatch{util::join(names, ", ")};
    }

    [[nodiscard]] size_t size() const noexcept { return m_routes.size(); }

private:
    // Keys view the string literals behind each webapi_path.
    std::unordered_map<std::string_view, std::vector<endpoint>> m_routes;
};

#endif // API_ROUTER_HPP
