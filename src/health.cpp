#include "health.hpp"
#include "json_parser.hpp"
#include <map>

namespace health {

void healthz([[maybe_unused]] const http::request& req, http::response& res) {
    res.set_body(http::status::ok, R"({"status":"ok"})");
}

api_handler_func make_readyz(const readiness& state, std::string version) {
    return [&state, version = std::move(version)]([[maybe_unused]] const http::request& req, http::response& res) {
        if (!state.is_ready()) {
            res.set_body(http::status::service_unavailable, R"({"status":"starting"})");
            return;
        }
        const std::map<std::string, std::string, std::less<>> body{
            {"status", "ready"},
            {"version", version}};
        res.set_body(http::status::ok, json::json_parser::build(body));
    };
}

} // namespace health
