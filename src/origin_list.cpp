#include "origin_list.hpp"
#include "logger.hpp"
#include <algorithm>
#include <charconv>
#include <ranges>
#include <utility>

using namespace std::literals::string_view_literals;

namespace {

constexpr std::string_view k_wildcard = "*"sv;

inline bool is_host_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

inline bool is_ipv6_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F') || c == ':' || c == '.';
}

// Accepts "" or ":<1-5 digits>" in the range 0..65535.
inline bool is_valid_port_suffix(std::string_view suffix) noexcept {
    if (suffix.empty()) {
        return true;
    }
    if (suffix.front() != ':') {
        return false;
    }
    suffix.remove_prefix(1);
    if (suffix.empty() || suffix.size() > 5) {
        return false;
    }
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), port);
    return ec == std::errc() && ptr == suffix.data() + suffix.size() && port <= 65535;
}

} // namespace

namespace cors {

origin_list::origin_list(kind k, origin_set origins)
    : m_kind(k), m_origins(std::move(origins))
{}

origin_list origin_list::any() {
    return origin_list{kind::allow_all};
}

origin_list origin_list::parse(std::string_view raw, const parse_options& options) {
    origin_set origins;
    bool wildcard = false;
    size_t skipped = 0;

    for (const auto part : raw | std::views::split(',')) {
        const auto entry = util::trim(std::string_view(part.begin(), part.end()));
        if (entry.empty()) {
            continue;
        }
        if (entry == k_wildcard) {
            wildcard = true;
            continue;
        }

        const auto origin = normalize_origin(entry);
        if (options.validate_origins && !is_valid_origin(origin)) {
            util::log::warn("Skipping malformed CORS origin '{}': expected scheme://host[:port]", entry);
            ++skipped;
            continue;
        }
        origins.emplace(origin);
    }

    if (wildcard) {
        if (!origins.empty()) {
            util::log::warn("CORS origin list contains '*', ignoring {} explicit origin(s).", origins.size());
        }
        return origin_list{kind::allow_all};
    }

    if (origins.empty()) {
        if (skipped > 0) {
            util::log::warn("None of the {} configured CORS origin(s) is valid, CORS is disabled.", skipped);
        }
        return origin_list{};
    }

    return origin_list{kind::explicit_set, std::move(origins)};
}

bool origin_list::contains(std::string_view origin) const noexcept {
    return m_kind == kind::explicit_set && m_origins.contains(origin);
}

std::string origin_list::to_string() const {
    switch (m_kind) {
        case kind::disabled:
            return "<disabled>";
        case kind::allow_all:
            return std::string(k_wildcard);
        case kind::explicit_set:
            break;
    }
    std::vector<std::string_view> sorted(m_origins.begin(), m_origins.end());
    std::ranges::sort(sorted);
    return util::join(sorted, ",");
}

bool is_valid_origin(std::string_view origin) noexcept {
    if (origin.starts_with("https://"sv)) {
        origin.remove_prefix(8);
    } else if (origin.starts_with("http://"sv)) {
        origin.remove_prefix(7);
    } else {
        return false;
    }

    if (origin.empty()) {
        return false;
    }

    std::string_view host;
    std::string_view rest;
    if (origin.front() == '[') {
        const auto close = origin.find(']');
        if (close == std::string_view::npos || close < 3) {
            return false;
        }
        host = origin.substr(1, close - 1);
        rest = origin.substr(close + 1);
        if (!std::ranges::all_of(host, is_ipv6_char)) {
            return false;
        }
    } else {
        const auto colon = origin.find(':');
        host = origin.substr(0, colon);
        rest = colon == std::string_view::npos ? std::string_view{} : origin.substr(colon);
        if (host.empty() || host.front() == '.' || host.front() == '-' || !std::ranges::all_of(host, is_host_char)) {
            return false;
        }
    }

    return is_valid_port_suffix(rest);
}

} // namespace cors
