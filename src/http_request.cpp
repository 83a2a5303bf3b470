#include "http_request.hpp"
#include "json_parser.hpp"
#include <utility>
#include <format>
#include <ranges>
#include <charconv>
#include <algorithm>

using namespace std::literals::string_view_literals;

namespace {

// Per RFC 9110, a field name is a 'token' (1*tchar).
inline bool is_valid_header_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    constexpr std::string_view valid_tchars =
        "!#$%&'*+-.^_`|~"
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    return key.find_first_not_of(valid_tchars) == std::string_view::npos;
}

// Bare CR/LF in a value would allow response splitting when a value such as
// Origin is echoed back.
inline bool is_valid_header_value(std::string_view value) {
    return value.find_first_of("\r\n"sv) == std::string_view::npos;
}

constexpr size_t MAX_PATH_LENGTH = 2048;

// Rejects relative paths, encoded characters and traversal sequences.
inline bool is_valid_path(std::string_view path) {
    if (path.empty() || path[0] != '/') {
        return false;
    }
    if (constexpr std::string_view invalid_chars = "%\0\r\n\\"sv; path.find_first_of(invalid_chars) != std::string_view::npos) {
        return false;
    }
    return !path.contains(".."sv);
}

} // namespace

namespace http {

// ===================================================================
//         request_parser: Implementation
// ===================================================================
request_parser::request_parser(size_t max_request_size)
    : m_buffer(std::make_unique<socket_buffer>(max_request_size))
{}

request_parser::~request_parser() noexcept = default;
request_parser::request_parser(request_parser&&) noexcept = default;
request_parser& request_parser::operator=(request_parser&&) noexcept = default;

auto request_parser::get_buffer() noexcept -> std::span<char> {
    return m_buffer->buffer();
}

auto request_parser::is_full() const noexcept -> bool {
    return m_buffer->available_size() == 0;
}

void request_parser::update_pos(ssize_t bytes_read) {
    if (m_isFinalized) {
        return;
    }
    m_buffer->update_pos(bytes_read);
}

// True once the request is complete or can no longer become valid; finalize()
// reports the latter as an error.
auto request_parser::eof() -> bool {
    if (!find_and_store_header_end()) {
        return false;
    }
    if (!parse_and_store_method()) {
        return true;
    }
    if (!method_has_body(*m_identifiedMethod)) {
        return true;
    }
    if (!parse_and_store_content_length()) {
        return true;
    }
    return m_buffer->size() >= (*m_identifiedHeaderSize + *m_identifiedContentLength);
}

auto request_parser::finalize() -> std::expected<void, request_parse_error> {
    if (m_isFinalized) {
        return {};
    }

    if (!eof()) {
        return std::unexpected(request_parse_error("Attempted to finalize before request reached eof()."));
    }

    if (m_identifiedMethod.value_or(method::unknown) == method::unknown) {
        return std::unexpected(request_parse_error("Unsupported or malformed request method."));
    }

    const auto request_sv = m_buffer->view();
    const auto first_line_end_pos = request_sv.find("\r\n"sv);
    if (auto err = parse_request_line(request_sv.substr(0, first_line_end_pos))) {
        return std::unexpected(*err);
    }
    m_parsedMethod = *m_identifiedMethod;

    // The header block sits between the request line and the blank line.
    const auto headers_begin = first_line_end_pos + 2;
    const auto headers_end = *m_identifiedHeaderSize - 4;
    const auto headers_sv = headers_begin < headers_end ? request_sv.substr(headers_begin, headers_end - headers_begin) : std::string_view{};
    if (auto err = parse_headers(headers_sv)) {
        return std::unexpected(*err);
    }

    m_headerSize = *m_identifiedHeaderSize;

    if (method_has_body(m_parsedMethod)) {
        if (!m_identifiedContentLength.has_value()) {
            return std::unexpected(request_parse_error(
                std::format("{} request without a valid Content-Length header.", to_string(m_parsedMethod))));
        }
        m_contentLength = *m_identifiedContentLength;
        if (auto err = parse_body()) {
            return std::unexpected(*err);
        }
    }

    m_isFinalized = true;
    return {};
}

auto request_parser::find_and_store_header_end() -> bool {
    if (m_identifiedHeaderSize.has_value()) {
        return true;
    }
    if (const auto headers_end_pos = m_buffer->view().find("\r\n\r\n"sv); headers_end_pos != std::string_view::npos) {
        m_identifiedHeaderSize = headers_end_pos + 4;
        return true;
    }
    return false;
}

auto request_parser::parse_and_store_method() -> bool {
    if (m_identifiedMethod.has_value()) {
        return *m_identifiedMethod != method::unknown;
    }

    const auto view = m_buffer->view();
    const auto space_pos = view.find(' ');
    if (space_pos == std::string_view::npos || space_pos >= *m_identifiedHeaderSize) {
        m_identifiedMethod = method::unknown;
        return false;
    }

    m_identifiedMethod = to_method(view.substr(0, space_pos));
    return *m_identifiedMethod != method::unknown;
}

auto request_parser::parse_and_store_content_length() -> bool {
    if (m_identifiedContentLength.has_value()) {
        return true;
    }

    const auto view = m_buffer->view();
    const auto request_line_end = view.find("\r\n"sv);
    const size_t headers_part_start = request_line_end + 2;
    if (request_line_end == std::string_view::npos || headers_part_start >= *m_identifiedHeaderSize - 2) {
        return false;
    }
    const auto headers_part = view.substr(headers_part_start, (*m_identifiedHeaderSize - 4) - headers_part_start);

    for (const auto line_range : headers_part | std::views::split("\r\n"sv)) {
        const std::string_view header_line(line_range.begin(), line_range.end());

        const auto colon_pos = header_line.find(':');
        if (colon_pos == std::string_view::npos || !util::ci_equal{}(header_line.substr(0, colon_pos), "Content-Length"sv)) {
            continue;
        }

        const auto cl_value_sv = util::trim(header_line.substr(colon_pos + 1));
        size_t temp_cl = 0;
        auto [ptr, ec] = std::from_chars(cl_value_sv.data(), cl_value_sv.data() + cl_value_sv.size(), temp_cl);
        if (ec == std::errc() && ptr == cl_value_sv.data() + cl_value_sv.size() && !cl_value_sv.empty()) {
            m_identifiedContentLength = temp_cl;
            return true;
        }
        return false;
    }
    return false;
}

auto request_parser::parse_request_line(std::string_view request_line) -> std::optional<request_parse_error> {
    auto parts = request_line | std::views::split(' ') | std::views::common;
    auto it = parts.begin();
    if (it == parts.end()) {
        return request_parse_error("Malformed request line: empty.");
    }
    ++it;
    if (it == parts.end()) {
        return request_parse_error("Malformed request line: missing URI.");
    }

    const std::string_view uri_sv((*it).begin(), (*it).end());
    ++it;
    if (it == parts.end() || !std::string_view((*it).begin(), (*it).end()).starts_with("HTTP/1."sv)) {
        return request_parse_error("Malformed request line: missing or unsupported HTTP version.");
    }
    return parse_uri(uri_sv);
}

// Query strings are refused outright; the routes take no parameters.
auto request_parser::parse_uri(std::string_view uri) -> std::optional<request_parse_error> {
    if (uri.contains('?')) {
        return request_parse_error(std::format("URI query parameters are not allowed. URI: '{}'", uri));
    }
    if (uri.length() > MAX_PATH_LENGTH) {
        return request_parse_error(std::format("URI exceeds maximum length of {}.", MAX_PATH_LENGTH));
    }
    if (!is_valid_path(uri)) {
        return request_parse_error(std::format("Invalid URI path: contains forbidden characters or traversal sequences. URI: '{}'", uri));
    }
    m_path = uri;
    return std::nullopt;
}

auto request_parser::parse_headers(std::string_view headers_sv) -> std::optional<request_parse_error> {
    for (const auto line_range : headers_sv | std::views::split("\r\n"sv)) {
        const std::string_view header_line(line_range.begin(), line_range.end());
        if (header_line.empty()) {
            continue;
        }

        const auto pos = header_line.find(':');
        if (pos == std::string_view::npos) {
            return request_parse_error(std::format("Malformed header line: {}", header_line));
        }

        const auto key = header_line.substr(0, pos);
        if (!is_valid_header_key(key)) {
            return request_parse_error(std::format("Invalid header key: {}", key));
        }

        const auto value = util::trim(header_line.substr(pos + 1));
        if (!is_valid_header_value(value)) {
            return request_parse_error(std::format("Invalid characters in header value for key: {}", key));
        }

        // Request smuggling protection: no chunked bodies, one Host.
        if (util::ci_equal{}(key, "Transfer-Encoding")) {
            return request_parse_error("Transfer-Encoding is not supported.");
        }
        if (util::ci_equal{}(key, "Host") && m_headers.contains("Host")) {
            return request_parse_error("Duplicate Host header detected.");
        }

        m_headers.try_emplace(std::string(key), value);
    }
    return std::nullopt;
}

auto request_parser::parse_body() -> std::optional<request_parse_error> {
    m_body = m_buffer->view().substr(m_headerSize, m_contentLength);
    if (m_body.empty()) {
        return std::nullopt;
    }

    const auto it = m_headers.find("content-type");
    if (it == m_headers.end()) {
        return request_parse_error(std::format("{} request with body is missing Content-Type header.", to_string(m_parsedMethod)));
    }

    if (it->second.starts_with("application/json"sv)) {
        try {
            [[maybe_unused]] const json::json_parser validated(m_body);
        } catch (const json::parsing_error& e) {
            return request_parse_error(std::string("JSON parse error: ") + e.what());
        }
    }
    return std::nullopt;
}


// ===================================================================
//         request: Implementation
// ===================================================================

request::request(request_parser&& parser, std::string_view remote_ip)
    : m_buffer(std::move(parser.m_buffer)),
      m_method(parser.m_parsedMethod),
      m_headers(std::move(parser.m_headers)),
      m_body(parser.m_body),
      m_path(parser.m_path),
      m_remote_ip(remote_ip)
{}

request::~request() = default;
request::request(request&&) noexcept = default;
request& request::operator=(request&&) noexcept = default;

auto request::get_method() const noexcept -> method { return m_method; }
auto request::get_method_str() const noexcept -> std::string_view { return to_string(m_method); }
auto request::get_remote_ip() const noexcept -> std::string_view { return m_remote_ip; }
auto request::get_headers() const noexcept -> const header_map& { return m_headers; }
auto request::get_body() const noexcept -> std::string_view { return m_body; }
auto request::get_path() const noexcept -> std::string_view { return m_path; }

auto request::get_header_value(std::string_view key) const noexcept -> std::optional<std::string_view> {
    if (auto it = m_headers.find(key); it != m_headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace http
