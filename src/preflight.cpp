#include "preflight.hpp"
#include "logger.hpp"
#include <utility>

namespace cors {

preflight_responder::preflight_responder(const origin_list& origins, preflight_spec spec)
    : m_origins(origins),
      m_spec(std::move(spec)),
      m_allow_methods(util::join(m_spec.allowed_methods, ", ")),
      m_allow_headers(util::join(m_spec.allowed_headers, ", ")),
      m_max_age(std::to_string(m_spec.max_age.count()))
{}

bool preflight_responder::is_preflight(const http::request& req) noexcept {
    if (req.get_method() != http::method::options) {
        return false;
    }
    const auto requested = req.get_header_value(header::request_method);
    return requested.has_value() && !requested->empty();
}

bool preflight_responder::respond(const http::request& req, http::response& res) const {
    if (!is_preflight(req)) {
        return false;
    }

    const auto origin = req.get_header_value(header::origin).value_or("");
    const auto verdict = match(origin, m_origins, m_spec.allow_credentials);

    if (!verdict.allowed) {
        util::log::debug("Preflight from origin '{}' for {} {} not allowed.",
                         origin, *req.get_header_value(header::request_method), req.get_path());
        res.set_no_content();
        return true;
    }

    util::log::debug("Preflight from origin '{}' for {} {} allowed (requested headers: '{}').",
                     origin,
                     *req.get_header_value(header::request_method),
                     req.get_path(),
                     req.get_header_value(header::request_headers).value_or(""));

    res.set_header(header::allow_origin, *verdict.allow_origin);
    res.set_header(header::allow_methods, m_allow_methods);
    res.set_header(header::allow_headers, m_allow_headers);
    if (verdict.allow_credentials) {
        res.set_header(header::allow_credentials, "true");
    }
    res.set_header(header::max_age, m_max_age);
    res.set_no_content();
    return true;
}

} // namespace cors
