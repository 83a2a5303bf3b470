#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include "socket_buffer.hpp"
#include "util.hpp"
#include <string_view>
#include <unordered_map>
#include <optional>
#include <string>
#include <stdexcept>
#include <expected>
#include <span>
#include <memory>

namespace http {

using header_map = std::unordered_map<std::string, std::string_view, util::ci_hash, util::ci_equal>;

class request_parse_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class method {
    get,
    post,
    put,
    patch,
    delete_,
    options,
    unknown
};

[[nodiscard]] constexpr std::string_view to_string(method m) noexcept {
    using enum method;
    switch (m) {
        case get:     return "GET";
        case post:    return "POST";
        case put:     return "PUT";
        case patch:   return "PATCH";
        case delete_: return "DELETE";
        case options: return "OPTIONS";
        case unknown: break;
    }
    return "UNKNOWN";
}

// Method tokens are case-sensitive (RFC 9110 9.1).
[[nodiscard]] constexpr method to_method(std::string_view token) noexcept {
    using enum method;
    for (const auto m : {get, post, put, patch, delete_, options}) {
        if (to_string(m) == token) {
            return m;
        }
    }
    return unknown;
}

// Methods whose requests must declare a Content-Length.
[[nodiscard]] constexpr bool method_has_body(method m) noexcept {
    return m == method::post || m == method::put || m == method::patch;
}

class request_parser;

class request {
public:
    explicit request(request_parser&& parser, std::string_view remote_ip);
    ~request();
    request(const request&) = delete;
    request& operator=(const request&) = delete;
    request(request&&) noexcept;
    request& operator=(request&&) noexcept;

    [[nodiscard]] auto get_method() const noexcept -> method;
    [[nodiscard]] auto get_method_str() const noexcept -> std::string_view;
    [[nodiscard]] auto get_remote_ip() const noexcept -> std::string_view;
    [[nodiscard]] auto get_headers() const noexcept -> const header_map&;
    [[nodiscard]] auto get_body() const noexcept -> std::string_view;
    [[nodiscard]] auto get_path() const noexcept -> std::string_view;
    [[nodiscard]] auto get_header_value(std::string_view key) const noexcept -> std::optional<std::string_view>;

private:
    std::unique_ptr<socket_buffer> m_buffer;
    method m_method{method::unknown};
    header_map m_headers;
    std::string_view m_body;
    std::string_view m_path;
    std::string m_remote_ip;
};


/**
 * @class request_parser
 * @brief Incremental HTTP/1.1 request parser.
 *
 * The I/O loop reads into get_buffer(), reports the byte count through
 * update_pos() and polls eof(); once the request is complete finalize()
 * validates it and the parser is moved into an http::request.
 */
class request_parser {
public:
    friend class request;
    explicit request_parser(size_t max_request_size = socket_buffer::k_default_max_size);
    ~request_parser() noexcept;
    request_parser(request_parser&&) noexcept;
    request_parser& operator=(request_parser&&) noexcept;
    request_parser(const request_parser&) = delete;
    request_parser& operator=(const request_parser&) = delete;

    [[nodiscard]] auto get_buffer() noexcept -> std::span<char>;
    void update_pos(ssize_t bytes_read);
    [[nodiscard]] auto eof() -> bool;
    [[nodiscard]] auto finalize() -> std::expected<void, request_parse_error>;

    // True when the buffer reached its size limit without a complete request.
    [[nodiscard]] auto is_full() const noexcept -> bool;

private:
    auto find_and_store_header_end() -> bool;
    auto parse_and_store_method() -> bool;
    auto parse_and_store_content_length() -> bool;
    auto parse_headers(std::string_view headers_sv) -> std::optional<request_parse_error>;
    auto parse_request_line(std::string_view request_line) -> std::optional<request_parse_error>;
    auto parse_uri(std::string_view uri) -> std::optional<request_parse_error>;
    auto parse_body() -> std::optional<request_parse_error>;

    std::unique_ptr<socket_buffer> m_buffer;

    method m_parsedMethod{method::unknown};
    std::optional<method> m_identifiedMethod;
    std::optional<size_t> m_identifiedContentLength;
    std::optional<size_t> m_identifiedHeaderSize;
    header_map m_headers;
    std::string_view m_body;
    std::string_view m_path;
    size_t m_contentLength{0};
    size_t m_headerSize{0};
    bool m_isFinalized{false};
};

} // namespace http

#endif // HTTP_REQUEST_HPP
