#ifndef SERVER_HPP
#define SERVER_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "logger.hpp"
#include "config.hpp"
#include "cors_policy.hpp"
#include "signal_handler.hpp"
#include "metrics.hpp"
#include "api_router.hpp"
#include "thread_pool.hpp"
#include "shared_queue.hpp"
#include "util.hpp"
#include <sys/epoll.h>
#include <stdexcept>
#include <unordered_map>
#include <memory>
#include <vector>
#include <atomic>
#include <functional>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string>

inline constexpr auto g_version = "1.2.0";

class server_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct connection_state {
    connection_state(uint64_t conn_id, std::string ip, size_t max_request_size)
        : parser(max_request_size),
          remote_ip(std::move(ip)),
          id(conn_id),
          last_activity(std::chrono::steady_clock::now()) {}

    http::request_parser parser;
    std::optional<http::response> response;
    std::string remote_ip;
    // Distinguishes a reused fd from the connection a worker answers.
    uint64_t id;
    // Set once a request was taken from the parser; further input is ignored.
    bool busy{false};
    std::chrono::steady_clock::time_point last_activity;

    void update_activity() {
        last_activity = std::chrono::steady_clock::now();
    }
};

struct response_item {
    int client_fd;
    uint64_t conn_id;
    http::response res;
};

/**
 * @class server
 * @brief Multi-threaded HTTP/1.1 server. Each I/O worker owns a listening
 * socket (SO_REUSEPORT), an epoll instance and a thread pool for handlers.
 *
 * Every parsed request goes through the CORS policy before routing: a
 * preflight is answered on the I/O thread, anything else continues with the
 * CORS headers already attached to its response.
 */
class server {
public:
    server(const config::server_config& cfg, const cors::policy& cors);
    ~server() noexcept;

    server(const server&) = delete;
    server& operator=(const server&) = delete;
    server(server&&) = delete;
    server& operator=(server&&) = delete;

    void register_api(webapi_path path, http::method method, api_handler_func handler) {
        m_router.register_api(path, method, std::move(handler));
    }

    // Runs until SIGINT, SIGTERM or SIGQUIT. on_listening is called once the
    // sockets are bound and the I/O threads run.
    void start(const std::function<void()>& on_listening = {});

private:
    class io_worker {
    public:
        io_worker(const config::server_config& cfg,
                  const cors::policy& cors,
                  std::shared_ptr<metrics> metrics,
                  const api_router& router,
                  size_t worker_thread_count,
                  std::atomic<bool>& running_flag);

        ~io_worker() noexcept;

        io_worker(const io_worker&) = delete;
        io_worker& operator=(const io_worker&) = delete;

        // Binds the listening socket; throws server_error.
        void setup_listening_socket();
        void run();

        [[nodiscard]] const thread_pool* get_thread_pool() const {
            return m_thread_pool.get();
        }

    private:
        void add_to_epoll(int fd, uint32_t events);
        void remove_from_epoll(int fd);
        void modify_epoll(int fd, uint32_t events);

        void on_connect();
        void on_read(int fd);
        void on_write(int fd);
        void close_connection(int fd, uint32_t events = 0);
        void check_timeouts();

        bool handle_socket_read(connection_state& conn, int fd);
        void process_request(int fd, connection_state& conn);
        void reject(int fd, connection_state& conn, http::status status, std::string_view message);
        void route(int fd, connection_state& conn, http::request req, http::response res, std::string request_id);
        void dispatch_to_worker(int fd, uint64_t conn_id, http::request req, http::response res,
                                std::string request_id, const api_router::endpoint* endpoint);
        void process_response_queue();
        [[nodiscard]] bool handle_internal_api(const http::request& req, http::response& res) const;

        void execute_handler(const http::request& req, http::response& res, const api_router::endpoint* endpoint) const;

        const config::server_config& m_config;
        const cors::policy& m_cors;
        std::shared_ptr<metrics> m_metrics;
        const api_router& m_router;
        std::atomic<bool>& m_running;

        int m_listening_fd{-1};
        int m_epoll_fd{-1};
        uint64_t m_next_conn_id{0};
        std::chrono::steady_clock::time_point m_last_timeout_check;

        std::unique_ptr<thread_pool> m_thread_pool;
        std::unique_ptr<shared_queue<response_item>> m_response_queue;
        std::unordered_map<int, connection_state> m_connections;
    };

    static inline constexpr int MAX_EVENTS = 8192;
    static inline constexpr int LISTEN_BACKLOG = 65536;
    static inline constexpr int EPOLL_WAIT_MS = 5;
    static inline constexpr std::chrono::seconds TIMEOUT_CHECK_INTERVAL{1};

    const config::server_config& m_config;
    const cors::policy& m_cors;

    std::unique_ptr<util::signal_handler> m_signals;
    std::shared_ptr<metrics> m_metrics;
    api_router m_router;

    std::vector<std::unique_ptr<io_worker>> m_workers;
    std::atomic<bool> m_running{true};
};

#endif // SERVER_HPP
