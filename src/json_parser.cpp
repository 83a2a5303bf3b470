#include "json_parser.hpp"
#include <format>
#include <memory>
#include <utility>

namespace json {

// parsing_error implementation
parsing_error::parsing_error(const std::string& msg)
    : std::runtime_error(msg) {}

// output_error implementation
output_error::output_error(const std::string& msg)
    : std::runtime_error(msg) {}

// json_parser implementation
json_parser::json_parser(std::string_view json_str) {
    auto* tok = json_tokener_new();
    if (!tok) {
        throw std::bad_alloc{};
    }

    // json-c wants a NUL-terminated buffer even when a length is given.
    const std::string temp_json_for_c_api(json_str);

    m_obj = json_tokener_parse_ex(
        tok, 
        temp_json_for_c_api.c_str(), 
        static_cast<int>(temp_json_for_c_api.size())
    );

    const auto parse_status = json_tokener_get_error(tok);
    // Trailing bytes after a complete value ("{}garbage") are rejected too.
    const bool trailing = parse_status == json_tokener_success &&
                          json_tokener_get_parse_end(tok) < temp_json_for_c_api.size();
    if (parse_status != json_tokener_success || m_obj == nullptr || trailing) {
        const std::string err = trailing ? "unexpected trailing characters" : json_tokener_error_desc(parse_status);
        json_tokener_free(tok);
        if (m_obj) {
            json_object_put(m_obj);
            m_obj = nullptr;
        }
        throw parsing_error(std::format("JSON parsing error: {} payload: {}", err, json_str));
    }

    json_tokener_free(tok);
}

json_parser::~json_parser() noexcept {
    if (m_obj) {
        json_object_put(m_obj);
    }
}

json_parser::json_parser(const json_parser& other)
    : m_obj(json_object_get(other.m_obj)) {}

json_parser& json_parser::operator=(const json_parser& other) {
    if (this != &other) {
        json_object_put(m_obj);
        m_obj = json_object_get(other.m_obj);
    }
    return *this;
}

json_parser::json_parser(json_parser&& other) noexcept
    : m_obj(other.m_obj) {
    other.m_obj = nullptr;
}

json_parser& json_parser::operator=(json_parser&& other) noexcept {
    if (this != &other) {
        json_object_put(m_obj);
        m_obj = other.m_obj;
        other.m_obj = nullptr;
    }
    return *this;
}

} // namespace json
