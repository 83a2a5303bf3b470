#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <array>
#include <iostream>
#include <string_view>
#include <format>
#include <syncstream>
#include <thread>
#include <string>
#include <utility>

namespace util::log {

// --- Thread-local request id ---

// Points to a string owned by the task that handles the request.
inline thread_local std::string_view g_request_id;

/**
 * @class request_id_scope
 * @brief RAII helper that sets the thread-local request id for the lifetime
 * of a request and clears it afterwards.
 */
class request_id_scope {
public:
    explicit request_id_scope(std::string_view id) noexcept
        : m_previous(g_request_id) {
        g_request_id = id;
    }
    ~request_id_scope() {
        g_request_id = m_previous;
    }
    request_id_scope(const request_id_scope&) = delete;
    request_id_scope& operator=(const request_id_scope&) = delete;
    request_id_scope(request_id_scope&&) = delete;
    request_id_scope& operator=(request_id_scope&&) = delete;

private:
    std::string_view m_previous;
};

[[nodiscard]] inline std::string_view current_request_id() noexcept {
    return g_request_id;
}

#ifdef ENABLE_DEBUG_LOGS
constexpr bool debug_logging_enabled = true;
#else
constexpr bool debug_logging_enabled = false;
#endif

enum class Level {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    constexpr std::array<std::string_view, 5> names{"DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
    return names[std::to_underlying(level)];
}

namespace detail {
    inline void vprint(const Level level, const std::string_view fmt, std::format_args args)
    {
        const bool to_stderr = level == Level::Error || level == Level::Critical;
        std::osyncstream synced_out(to_stderr ? std::cerr : std::cout);
        synced_out << std::format("[{:^8}] [Thread: {}] [{}] ",
                                  to_string(level),
                                  std::this_thread::get_id(),
                                  g_request_id.empty() ? "--------" : g_request_id);
        synced_out << std::vformat(fmt, args) << '\n';
    }
} // namespace detail

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if constexpr (debug_logging_enabled) {
        detail::vprint(Level::Debug, fmt.get(), std::make_format_args(args...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Info, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Warning, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Error, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void critical(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Critical, fmt.get(), std::make_format_args(args...));
}

} // namespace util::log

#endif // LOGGER_HPP
