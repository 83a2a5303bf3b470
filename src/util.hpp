#ifndef UTIL_HPP
#define UTIL_HPP

#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <array>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <new> // For std::bad_alloc

// Includes for POSIX/networking functions
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <climits> // For HOST_NAME_MAX
#include <uuid/uuid.h> // For UUID generation

namespace util {

struct string_hash {
    using is_transparent = void;
    [[nodiscard]] size_t operator()(const char* txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(std::string_view txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(const std::string& txt) const {
        return std::hash<std::string>{}(txt);
    }
};

struct string_equal {
    using is_transparent = void;
    [[nodiscard]] constexpr bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};

// Case-insensitive variants, used for HTTP header names.
struct ci_hash {
    using is_transparent = void;
    [[nodiscard]] size_t operator()(std::string_view sv) const noexcept {
        size_t hash = 5381;
        for (const auto c : sv) {
            hash = ((hash << 5) + hash) + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct ci_equal {
    using is_transparent = void;
    [[nodiscard]] bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    }
};

/**
 * @brief Removes leading and trailing whitespace (space, tab, CR, LF, VT, FF).
 */
[[nodiscard]] constexpr std::string_view trim(std::string_view sv) noexcept {
    constexpr std::string_view blanks{" \t\r\n\v\f"};
    sv.remove_prefix(std::min(sv.find_first_not_of(blanks), sv.size()));
    if (const auto last = sv.find_last_not_of(blanks); last != std::string_view::npos) {
        sv = sv.substr(0, last + 1);
    }
    return sv;
}

/**
 * @brief Joins a range of strings with a separator.
 */
template <typename Range>
[[nodiscard]] std::string join(const Range& items, std::string_view separator) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            out.append(separator);
        }
        out.append(item);
        first = false;
    }
    return out;
}

/**
 * @brief Gets the hostname of the current machine (e.g., the pod name in k8s).
 * @return The hostname as a string, or a default string on failure.
 */
[[nodiscard]] inline std::string get_pod_name() noexcept {
    try {
        long host_name_max = sysconf(_SC_HOST_NAME_MAX);
        if (host_name_max <= 0) {
            host_name_max = HOST_NAME_MAX;
        }

        std::vector<char> hostname_buffer(static_cast<size_t>(host_name_max) + 1, '\0');
        if (gethostname(hostname_buffer.data(), hostname_buffer.size() - 1) != 0) {
            return "hostname_not_available";
        }

        const auto end = std::ranges::find(hostname_buffer, '\0');
        return std::string(hostname_buffer.begin(), end);
    } catch (const std::bad_alloc&) {
        return "hostname_lookup_exception";
    }
}

/**
 * @brief Converts a standard C errno number to a C++ string message.
 */
[[nodiscard]] inline std::string str_error_cpp(int err_num) noexcept {
    try {
        return std::error_code(err_num, std::system_category()).message();
    } catch (const std::exception&) {
        return "error_message_lookup_failed";
    }
}

/**
 * @brief Retrieves the pending socket error message for a given file descriptor.
 */
[[nodiscard]] inline std::string get_socket_error(int fd) noexcept {
    int error = 0;
    if (socklen_t errlen = sizeof(error); getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &errlen) == 0 && error != 0) {
        return str_error_cpp(error);
    }
    return "no error message available";
}

/**
 * @brief Gets the IPv4 address of the peer connected to a given socket.
 * @return The peer's IP address as a string, or an empty string on failure.
 */
[[nodiscard]] inline std::string get_peer_ip_ipv4(int sockfd) noexcept {
    try {
        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        // C sockets API idiom: sockaddr_in passed as the generic sockaddr.
        if (getpeername(sockfd, (sockaddr*)&addr, &addr_len) == 0) {
            std::array<char, INET_ADDRSTRLEN> buffer{};
            if (inet_ntop(AF_INET, &addr.sin_addr, buffer.data(), buffer.size())) {
                return std::string{buffer.data()};
            }
        }
    } catch (const std::bad_alloc&) {
        return "";
    }
    return "";
}

/**
 * @brief Generates a new version 4 UUID, used as request id when the client sends none.
 */
[[nodiscard]] inline std::string get_uuid() noexcept
{
    try {
        std::array<unsigned char, 16> out;
        uuid_generate(out.data());
        std::array<char, 37> uuid_str;
        uuid_unparse_lower(out.data(), uuid_str.data());
        return std::string(uuid_str.data());
    } catch (const std::bad_alloc&) {
        return "uuid_generation_failed";
    }
}

namespace detail {
    /**
     * @brief Reads a numeric value from a line in a procfs file.
     * @return The parsed value in KB, or 0 on failure.
     */
    inline size_t get_proc_info(const std::string& filename, std::string_view token) noexcept
    {
        try {
            std::ifstream proc_file(filename);
            if (!proc_file.is_open()) {
                return 0;
            }

            std::string line;
            while (std::getline(proc_file, line)) {
                if (line.starts_with(token)) {
                    std::istringstream iss{line};
                    std::string label;
                    size_t value = 0;
                    iss >> label >> value;
                    return value;
                }
            }
        } catch (const std::exception&) {
            return 0;
        }
        return 0;
    }
} // namespace detail

[[nodiscard]] inline size_t get_total_memory() noexcept
{
    return detail::get_proc_info("/proc/meminfo", "MemTotal:");
}

[[nodiscard]] inline size_t get_memory_usage() noexcept
{
    return detail::get_proc_info("/proc/self/status", "VmRSS:");
}

} // namespace util

#endif // UTIL_HPP
