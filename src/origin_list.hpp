#ifndef ORIGIN_LIST_HPP
#define ORIGIN_LIST_HPP

#include "util.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cors {

using origin_set = std::unordered_set<std::string, util::string_hash, util::string_equal>;

struct parse_options {
    // When false any non-empty token is accepted verbatim as an origin.
    bool validate_origins{true};
};

/**
 * @class origin_list
 * @brief The configured set of origins allowed to make cross-origin requests.
 *
 * A list is in exactly one of three states:
 *  - disabled: empty configuration, CORS headers are never emitted;
 *  - allow_all: the configuration contained "*";
 *  - explicit: a set of normalized origins (scheme://host[:port]),
 *    matched exactly and case-sensitively.
 *
 * Built once at startup and immutable afterwards.
 */
class origin_list {
public:
    enum class kind {
        disabled,
        allow_all,
        explicit_set
    };

    // A default-constructed list is disabled.
    origin_list() = default;

    /**
     * @brief Parses a comma-separated origins string.
     *
     * Entries are trimmed of surrounding whitespace, line breaks included, empty entries dropped and duplicates collapsed.
     * A single trailing '/' is removed from each entry. Malformed entries are
     * logged and skipped when validation is on; they never fail the list.
     *
     * @param raw The configured value, e.g. "http://localhost:3000, https://example.com".
     */
    [[nodiscard]] static origin_list parse(std::string_view raw, const parse_options& options = {});

    [[nodiscard]] static origin_list any();

    [[nodiscard]] kind get_kind() const noexcept { return m_kind; }
    [[nodiscard]] bool is_disabled() const noexcept { return m_kind == kind::disabled; }
    [[nodiscard]] bool allows_any() const noexcept { return m_kind == kind::allow_all; }

    /**
     * @brief Exact membership test. Always false for disabled and wildcard lists.
     */
    [[nodiscard]] bool contains(std::string_view origin) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return m_origins.size(); }
    [[nodiscard]] const origin_set& origins() const noexcept { return m_origins; }

    // Sorted, comma-joined rendering for log lines.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const origin_list&) const = default;

private:
    explicit origin_list(kind k, origin_set origins = {});

    kind m_kind{kind::disabled};
    origin_set m_origins;
};

/**
 * @brief Checks the syntax of a serialized origin: "http" or "https", "://",
 * a host name or bracketed IPv6 literal and an optional ":port".
 * Paths, queries, fragments, user-info and whitespace are rejected.
 */
[[nodiscard]] bool is_valid_origin(std::string_view origin) noexcept;

/**
 * @brief Removes a single trailing '/' ("https://a.example/" -> "https://a.example").
 */
[[nodiscard]] constexpr std::string_view normalize_origin(std::string_view entry) noexcept {
    if (entry.size() > 1 && entry.ends_with('/')) {
        entry.remove_suffix(1);
    }
    return entry;
}

} // namespace cors

#endif // ORIGIN_LIST_HPP
