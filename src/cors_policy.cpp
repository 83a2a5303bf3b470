#include "cors_policy.hpp"
#include "logger.hpp"
#include <format>
#include <utility>

namespace cors {

policy::policy(origin_list origins, preflight_spec spec)
    : m_origins(std::move(origins)),
      m_preflight(m_origins, std::move(spec)),
      m_expose_headers(util::join(m_preflight.spec().exposed_headers, ", "))
{}

result policy::intercept(const http::request& req, http::response& res) const {
    if (m_origins.is_disabled()) {
        return result::disabled;
    }

    const auto origin = req.get_header_value(header::origin).value_or("");
    if (origin.empty()) {
        return result::not_cors;
    }

    if (m_preflight.respond(req, res)) {
        return result::preflight_answered;
    }

    const auto verdict = match(origin, m_origins, spec().allow_credentials);
    if (!verdict.allowed) {
        util::log::debug("Origin '{}' not allowed for {} {}, serving without CORS headers.",
                         origin, req.get_method_str(), req.get_path());
        return result::denied;
    }

    res.set_header(header::allow_origin, *verdict.allow_origin);
    if (verdict.allow_credentials) {
        res.set_header(header::allow_credentials, "true");
    }
    if (!m_expose_headers.empty()) {
        res.set_header(header::expose_headers, m_expose_headers);
    }
    if (verdict.vary_origin) {
        res.append_header(header::vary, header::origin);
    }
    return result::allowed;
}

result policy::handle(const http::request& req, http::response& res, const handler& next) const {
    const auto outcome = intercept(req, res);
    if (outcome != result::preflight_answered && next) {
        next(req, res);
    }
    return outcome;
}

handler policy::wrap(handler next) const {
    return [this, next = std::move(next)](const http::request& req, http::response& res) {
        handle(req, res, next);
    };
}

std::string policy::describe() const {
    const auto& s = spec();
    switch (m_origins.get_kind()) {
        case origin_list::kind::disabled:
            return "CORS disabled (no allowed origins configured)";
        case origin_list::kind::allow_all:
            return std::format("CORS enabled for any origin (credentials: {}, max-age: {}s)",
                               s.allow_credentials, s.max_age.count());
        case origin_list::kind::explicit_set:
            break;
    }
    return std::format("CORS enabled for {} origin(s) [{}] (credentials: {}, max-age: {}s)",
                       m_origins.size(), m_origins.to_string(), s.allow_credentials, s.max_age.count());
}

} // namespace cors
