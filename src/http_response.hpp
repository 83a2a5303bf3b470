#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include "util.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <span>
#include <format>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <utility>

namespace http {

enum class status {
    ok = 200,
    no_content = 204,
    bad_request = 400,
    not_found = 404,
    method_not_allowed = 405,
    entity_too_large = 413,
    internal_server_error = 500,
    service_unavailable = 503
};

[[nodiscard]] constexpr std::string_view to_reason_phrase(status s) {
    using enum status;
    switch (s) {
        case ok: return "OK";
        case no_content: return "No Content";
        case bad_request: return "Bad Request";
        case not_found: return "Not Found";
        case method_not_allowed: return "Method Not Allowed";
        case entity_too_large: return "Entity Too Large";
        case internal_server_error: return "Internal Server Error";
        case service_unavailable: return "Service Unavailable";
    }
    return "Unknown Status";
}

using header_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @class response
 * @brief Collects headers, then serializes status line, headers and body into
 * a single wire buffer when set_body() or set_no_content() is called.
 *
 * Headers must be added before the body; once finalized the response is
 * immutable and only the write position advances.
 */
class response {
public:
    response() { m_buffer.reserve(4096); }

    /**
     * @brief Sets a header, replacing an existing one with the same (case-insensitive) name.
     * Values containing CR or LF are dropped to prevent response splitting.
     */
    void set_header(std::string_view name, std::string_view value);

    /**
     * @brief Appends to a list-valued header ("Vary: Accept-Encoding, Origin").
     */
    void append_header(std::string_view name, std::string_view value);

    [[nodiscard]] std::optional<std::string_view> get_header(std::string_view name) const noexcept;
    [[nodiscard]] const header_list& get_headers() const noexcept { return m_headers; }

    void set_body(status s, std::string_view body, std::string_view content_type = "application/json; charset=utf-8");

    // 204-style answer with an empty body, used for preflights.
    void set_no_content(status s = status::no_content);

    [[nodiscard]] bool is_finalized() const noexcept { return m_finalized; }
    [[nodiscard]] std::optional<status> status_code() const noexcept { return m_status; }
    [[nodiscard]] std::string_view get_body() const noexcept;

    [[nodiscard]] std::span<const char> buffer() const noexcept;
    [[nodiscard]] size_t available_size() const noexcept;
    void update_pos(size_t bytes_sent) noexcept;

private:
    header_list::iterator find_header(std::string_view name) noexcept;
    void write_status_and_headers(status s);

    std::vector<char> m_buffer;
    size_t m_readPos{0};
    size_t m_bodyOffset{0};
    bool m_finalized{false};
    std::optional<status> m_status;
    header_list m_headers;
};

inline header_list::iterator response::find_header(std::string_view name) noexcept {
    return std::ranges::find_if(m_headers, [name](const auto& h) { return util::ci_equal{}(h.first, name); });
}

inline void response::set_header(std::string_view name, std::string_view value) {
    if (m_finalized || value.find_first_of("\r\n") != std::string_view::npos) {
        return;
    }
    if (auto it = find_header(name); it != m_headers.end()) {
        it->second = value;
    } else {
        m_headers.emplace_back(name, value);
    }
}

inline void response::append_header(std::string_view name, std::string_view value) {
    if (m_finalized || value.find_first_of("\r\n") != std::string_view::npos) {
        return;
    }
    if (auto it = find_header(name); it != m_headers.end()) {
        it->second.append(", ").append(value);
    } else {
        m_headers.emplace_back(name, value);
    }
}

inline std::optional<std::string_view> response::get_header(std::string_view name) const noexcept {
    auto it = std::ranges::find_if(m_headers, [name](const auto& h) { return util::ci_equal{}(h.first, name); });
    if (it == m_headers.end()) {
        return std::nullopt;
    }
    return std::string_view{it->second};
}

inline void response::write_status_and_headers(status s) {
    auto out = std::back_inserter(m_buffer);
    std::format_to(out, "HTTP/1.1 {} {}\r\nDate: {:%a, %d %b %Y %H:%M:%S GMT}\r\n",
                   std::to_underlying(s),
                   to_reason_phrase(s),
                   std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    for (const auto& [name, value] : m_headers) {
        std::format_to(out, "{}: {}\r\n", name, value);
    }
}

inline void response::set_body(status s, std::string_view body, std::string_view content_type) {
    if (m_finalized) return;
    m_status = s;
    write_status_and_headers(s);
    std::format_to(
        std::back_inserter(m_buffer),
        "Strict-Transport-Security: max-age=31536000; includeSubDomains\r\n"
        "X-Frame-Options: SAMEORIGIN\r\n"
        "X-Content-Type-Options: nosniff\r\n"
        "Referrer-Policy: no-referrer\r\n"
        "Cache-Control: no-store\r\n"
        "Connection: close\r\n"
        "Content-Type: {}\r\n"
        "Content-Length: {}\r\n"
        "\r\n",
        content_type,
        body.size());
    m_bodyOffset = m_buffer.size();
    m_buffer.insert(m_buffer.end(), body.begin(), body.end());
    m_finalized = true;
}

inline void response::set_no_content(status s) {
    if (m_finalized) return;
    m_status = s;
    write_status_and_headers(s);
    constexpr std::string_view trailer = "Connection: close\r\nContent-Length: 0\r\n\r\n";
    m_buffer.insert(m_buffer.end(), trailer.begin(), trailer.end());
    m_bodyOffset = m_buffer.size();
    m_finalized = true;
}

inline std::string_view response::get_body() const noexcept {
    if (!m_finalized) {
        return {};
    }
    return {m_buffer.data() + m_bodyOffset, m_buffer.size() - m_bodyOffset};
}

inline std::span<const char> response::buffer() const noexcept {
    if (m_readPos >= m_buffer.size()) {
        return {};
    }
    return {m_buffer.data() + m_readPos, available_size()};
}

inline size_t response::available_size() const noexcept {
    return m_buffer.size() > m_readPos ? m_buffer.size() - m_readPos : 0;
}

inline void response::update_pos(size_t bytes_sent) noexcept {
    m_readPos += bytes_sent;
}

} // namespace http

#endif // HTTP_RESPONSE_HPP
