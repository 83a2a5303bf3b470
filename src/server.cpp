#include "server.hpp"
#include "json_parser.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <cstring>
#include <format>
#include <functional>
#include <map>
#include <thread>
#include <algorithm>

namespace {

struct worker_task {
    http::request req;
    http::response res;
    std::string request_id;
};

std::string error_body(std::string_view message) {
    const std::map<std::string, std::string, std::less<>> body{{"error", std::string(message)}};
    return json::json_parser::build(body);
}

} // namespace

// ===================================================================
//         server::io_worker Implementation
// ===================================================================
server::io_worker::io_worker(const config::server_config& cfg,
                             const cors::policy& cors,
                             std::shared_ptr<metrics> metrics_ptr,
                             const api_router& router,
                             size_t worker_thread_count,
                             std::atomic<bool>& running_flag)
    : m_config(cfg),
      m_cors(cors),
      m_metrics(std::move(metrics_ptr)),
      m_router(router),
      m_running(running_flag),
      m_last_timeout_check(std::chrono::steady_clock::now()),
      m_thread_pool(std::make_unique<thread_pool>(worker_thread_count, cfg.queue_capacity)),
      m_response_queue(std::make_unique<shared_queue<response_item>>())
{}

server::io_worker::~io_worker() noexcept {
    // Workers may still push into the response queue until the pool is joined.
    m_thread_pool->stop();
    for (const auto& [fd, conn] : m_connections) {
        close(fd);
    }
    if (m_epoll_fd != -1) {
        close(m_epoll_fd);
    }
    if (m_listening_fd != -1) {
        close(m_listening_fd);
    }
}

void server::io_worker::setup_listening_socket() {
    m_listening_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (m_listening_fd == -1) throw server_error("Failed to create socket");

    int opt = 1;
    if (setsockopt(m_listening_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) throw server_error("Failed to set SO_REUSEADDR");
    if (setsockopt(m_listening_fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) == -1) throw server_error("Failed to set SO_REUSEPORT");

    if (fcntl(m_listening_fd, F_SETFL, O_NONBLOCK) == -1) throw server_error("Failed to set socket to non-blocking");

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(m_config.port);
    if (bind(m_listening_fd, (sockaddr*)&server_addr, sizeof(server_addr)) == -1) {
        throw server_error(std::format("Failed to bind to port {}: {}", m_config.port, util::str_error_cpp(errno)));
    }
    if (listen(m_listening_fd, LISTEN_BACKLOG) == -1) throw server_error("Failed to listen on socket");

    m_epoll_fd = epoll_create1(0);
    if (m_epoll_fd == -1) throw server_error("Failed to create epoll instance for worker");
    add_to_epoll(m_listening_fd, EPOLLIN);
}

void server::io_worker::run() {
    util::log::debug("I/O worker thread {} listening on port {}.", std::this_thread::get_id(), m_config.port);
    m_thread_pool->start();

    std::vector<epoll_event> events(MAX_EVENTS);

    while (m_running) {
        const int num_events = epoll_wait(m_epoll_fd, events.data(), MAX_EVENTS, EPOLL_WAIT_MS);
        if (num_events == -1) {
            if (errno == EINTR) continue;
            util::log::error("epoll_wait failed in worker {}: {}", std::this_thread::get_id(), util::str_error_cpp(errno));
            return;
        }

        for (int i = 0; i < num_events; ++i) {
            const auto& event = events[i];
            const int fd = event.data.fd;

            if (fd == m_listening_fd) {
                on_connect();
            } else if (event.events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
                close_connection(fd, event.events);
            } else if (event.events & EPOLLIN) {
                on_read(fd);
            } else if (event.events & EPOLLOUT) {
                on_write(fd);
            }
        }
        process_response_queue();
        check_timeouts();
    }
    util::log::debug("I/O worker thread {} finished.", std::this_thread::get_id());
}

void server::io_worker::add_to_epoll(int fd, uint32_t events) {
    epoll_event event{};
    event.events = events | EPOLLET | EPOLLRDHUP;
    event.data.fd = fd;
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1 && errno != EEXIST) {
        throw server_error(std::format("Failed to add fd {} to epoll", fd));
    }
}

void server::io_worker::remove_from_epoll(int fd) {
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        util::log::error("Failed to remove fd {} from epoll: {}", fd, util::str_error_cpp(errno));
    }
}

void server::io_worker::modify_epoll(int fd, uint32_t events) {
    epoll_event event{};
    event.events = events | EPOLLET | EPOLLRDHUP;
    event.data.fd = fd;
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1) {
        util::log::error("Failed to modify fd {} in epoll: {}", fd, util::str_error_cpp(errno));
    }
}

void server::io_worker::on_connect() {
    while (true) {
        const int client_fd = accept4(m_listening_fd, nullptr, nullptr, SOCK_NONBLOCK);
        if (client_fd == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            util::log::error("accept4 failed: {}", util::str_error_cpp(errno));
            break;
        }
        std::string client_ip = util::get_peer_ip_ipv4(client_fd);
        util::log::debug("Accepted connection from {} on fd {}", client_ip, client_fd);

        try {
            add_to_epoll(client_fd, EPOLLIN);
        } catch (const server_error& e) {
            util::log::error("{}", e.what());
            close(client_fd);
            continue;
        }
        m_connections.try_emplace(client_fd, m_next_conn_id++, std::move(client_ip), m_config.max_request_size);
        m_metrics->increment_connections();
    }
}

void server::io_worker::on_read(int fd) {
    const auto it = m_connections.find(fd);
    if (it == m_connections.end()) return;
    connection_state& conn = it->second;

    if (conn.busy) return;
    if (!handle_socket_read(conn, fd)) return;

    if (conn.parser.eof()) {
        process_request(fd, conn);
    } else if (conn.parser.is_full()) {
        util::log::warn("Request from {} on fd {} exceeds {} bytes.", conn.remote_ip, fd, m_config.max_request_size);
        reject(fd, conn, http::status::entity_too_large, "Request Entity Too Large");
    }
}

void server::io_worker::on_write(int fd) {
    const auto it = m_connections.find(fd);
    if (it == m_connections.end() || !it->second.response.has_value()) return;

    http::response& res = *it->second.response;

    while (res.available_size() > 0) {
        const ssize_t bytes_sent = write(fd, res.buffer().data(), res.buffer().size());
        if (bytes_sent == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            util::log::error("write error on fd {}: {}", fd, util::str_error_cpp(errno));
            close_connection(fd);
            return;
        }
        res.update_pos(static_cast<size_t>(bytes_sent));
        it->second.update_activity();
    }

    close_connection(fd);
}

void server::io_worker::close_connection(int fd, uint32_t events) {
    if (events & EPOLLERR) {
        util::log::warn("Closing connection on fd {} due to socket error: {}", fd, util::get_socket_error(fd));
    } else if (events & (EPOLLHUP | EPOLLRDHUP)) {
        util::log::debug("Closing connection on fd {} (peer hung up).", fd);
    }

    remove_from_epoll(fd);
    if (m_connections.erase(fd) > 0) {
        m_metrics->decrement_connections();
    }
    close(fd);
}

// Slowloris protection: drops connections idle for longer than the read
// timeout. A connection waiting on its handler is not idle.
void server::io_worker::check_timeouts() {
    const auto now = std::chrono::steady_clock::now();
    if (now - m_last_timeout_check < TIMEOUT_CHECK_INTERVAL) {
        return;
    }
    m_last_timeout_check = now;

    std::vector<int> expired;
    for (const auto& [fd, conn] : m_connections) {
        if (conn.busy && !conn.response.has_value()) {
            continue;
        }
        if (now - conn.last_activity > m_config.read_timeout) {
            expired.push_back(fd);
        }
    }
    for (const int fd : expired) {
        util::log::warn("Closing idle connection on fd {} after {}s.", fd, m_config.read_timeout.count());
        close_connection(fd);
    }
}

bool server::io_worker::handle_socket_read(connection_state& conn, int fd) {
    while (true) {
        auto buffer = conn.parser.get_buffer();
        if (buffer.empty()) {
            break;
        }
        const ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
        if (bytes_read == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            util::log::error("read error on fd {}: {}", fd, util::str_error_cpp(errno));
            close_connection(fd);
            return false;
        }
        if (bytes_read == 0) {
            close_connection(fd);
            return false;
        }
        conn.parser.update_pos(bytes_read);
        conn.update_activity();
    }
    return true;
}

void server::io_worker::reject(int fd, connection_state& conn, http::status status, std::string_view message) {
    conn.busy = true;
    m_metrics->increment_rejected();
    http::response res;
    res.set_body(status, error_body(message));
    m_response_queue->push({fd, conn.id, std::move(res)});
}

void server::io_worker::process_request(int fd, connection_state& conn) {
    if (auto parsed = conn.parser.finalize(); !parsed.has_value()) {
        util::log::warn("Failed to parse request from {} on fd {}: {}", conn.remote_ip, fd, parsed.error().what());
        reject(fd, conn, http::status::bad_request, "Bad Request");
        return;
    }
    conn.busy = true;

    http::request req(std::move(conn.parser), conn.remote_ip);

    std::string request_id(req.get_header_value("X-Request-Id").value_or(""));
    if (request_id.empty()) {
        request_id = util::get_uuid();
    }
    const util::log::request_id_scope rid_scope(request_id);

    http::response res;
    res.set_header("X-Request-Id", request_id);

    const auto outcome = m_cors.intercept(req, res);
    m_metrics->record_cors(outcome);
    util::log::debug("CORS {} for {} {} from {}.", cors::to_string(outcome), req.get_method_str(), req.get_path(), conn.remote_ip);
    if (outcome == cors::result::preflight_answered) {
        m_response_queue->push({fd, conn.id, std::move(res)});
        return;
    }

    // Copied: rid_scope keeps viewing request_id.
    route(fd, conn, std::move(req), std::move(res), request_id);
}

void server::io_worker::route(int fd, connection_state& conn, http::request req, http::response res, std::string request_id) {
    if (handle_internal_api(req, res)) {
        m_response_queue->push({fd, conn.id, std::move(res)});
        return;
    }

    const auto lookup = m_router.find(req.get_path(), req.get_method());
    if (const auto* endpoint = std::get_if<const api_router::endpoint*>(&lookup)) {
        dispatch_to_worker(fd, conn.id, std::move(req), std::move(res), std::move(request_id), *endpoint);
        return;
    }

    if (const auto* mismatch = std::get_if<api_router::method_mismatch>(&lookup)) {
        res.set_header("Allow", mismatch->allow);
        res.set_body(http::status::method_not_allowed, error_body("Method Not Allowed"));
    } else {
        res.set_body(http::status::not_found, error_body("Not Found"));
    }
    m_response_queue->push({fd, conn.id, std::move(res)});
}

void server::io_worker::execute_handler(const http::request& req, http::response& res, const api_router::endpoint* endpoint) const {
    using enum http::status;
    try {
        endpoint->handler(req, res);
        if (!res.is_finalized()) {
            util::log::error("Handler for '{}' produced no response.", req.get_path());
            res.set_body(internal_server_error, error_body("Internal Server Error"));
        }
    } catch (const json::parsing_error& e) {
        util::log::error("JSON parsing error in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(bad_request, error_body("Invalid JSON format in request"));
    } catch (const json::output_error& e) {
        util::log::error("JSON output error in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(internal_server_error, error_body("Failed to generate JSON response"));
    } catch (const std::exception& e) {
        util::log::error("Unhandled exception in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(internal_server_error, error_body("Internal Server Error"));
    }
}

void server::io_worker::dispatch_to_worker(int fd, uint64_t conn_id, http::request req, http::response res,
                                           std::string request_id, const api_router::endpoint* endpoint) {
    // std::function needs a copyable callable; the task state is shared instead.
    auto task = std::make_shared<worker_task>(std::move(req), std::move(res), std::move(request_id));

    try {
        m_thread_pool->push_task([this, fd, conn_id, task, endpoint]() {
            const util::log::request_id_scope rid_scope(task->request_id);
            const auto start_time = std::chrono::steady_clock::now();
            m_metrics->increment_active_threads();

            execute_handler(task->req, task->res, endpoint);

            const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time);
            m_response_queue->push({fd, conn_id, std::move(task->res)});
            m_metrics->record_request_time(duration);
            m_metrics->decrement_active_threads();
            util::log::debug("Handler for '{}' executed in {} microseconds.", task->req.get_path(), duration.count());
        });
    } catch (const queue_full_error&) {
        util::log::warn("Task queue full, rejecting {} {}.", task->req.get_method_str(), task->req.get_path());
        m_metrics->increment_rejected();
        // CORS headers already attached stay, so the browser can read the 503.
        task->res.set_body(http::status::service_unavailable, error_body("Service Unavailable"));
        m_response_queue->push({fd, conn_id, std::move(task->res)});
    }
}

bool server::io_worker::handle_internal_api(const http::request& req, http::response& res) const {
    using enum http::status;
    const auto path = req.get_path();
    if (path == "/metrics") {
        res.set_body(ok, m_metrics->to_json());
        return true;
    }
    if (path == "/ping") {
        res.set_body(ok, R"({"status":"OK"})");
        return true;
    }
    if (path == "/version") {
        const std::map<std::string, std::string, std::less<>> body{
            {"pod_name", m_metrics->get_pod_name()},
            {"version", g_version}};
        res.set_body(ok, json::json_parser::build(body));
        return true;
    }
    return false;
}

void server::io_worker::process_response_queue() {
    std::vector<response_item> response_batch;
    m_response_queue->drain_to(response_batch);

    for (auto& item : response_batch) {
        const auto it = m_connections.find(item.client_fd);
        if (it == m_connections.end() || it->second.id != item.conn_id) {
            util::log::debug("Dropping response for closed connection on fd {}.", item.client_fd);
            continue;
        }
        it->second.response = std::move(item.res);
        it->second.update_activity();
        modify_epoll(it->first, EPOLLOUT);
        // Edge-triggered: the socket is usually writable already, so try now.
        on_write(it->first);
    }
}

// ===================================================================
//         server Implementation
// ===================================================================

server::server(const config::server_config& cfg, const cors::policy& cors)
    : m_config(cfg),
      m_cors(cors),
      m_signals(std::make_unique<util::signal_handler>()),
      m_metrics(std::make_shared<metrics>(cfg.pool_size))
{}

server::~server() noexcept = default;

void server::start(const std::function<void()>& on_listening) {
    util::log::info("Chatbox gateway version {} starting on port {} with {} I/O threads and {} total worker threads.",
                    g_version, m_config.port, m_config.io_threads, m_config.pool_size);
    util::log::info("{}", m_cors.describe());

    const auto worker_threads_per_io = static_cast<size_t>(std::max(1, m_config.pool_size / m_config.io_threads));
    util::log::info("Assigning {} worker threads per I/O worker.", worker_threads_per_io);

    // Sockets are bound here so a bind failure stops startup.
    for (int i = 0; i < m_config.io_threads; ++i) {
        auto worker = std::make_unique<io_worker>(m_config, m_cors, m_metrics, m_router, worker_threads_per_io, m_running);
        worker->setup_listening_socket();
        m_metrics->register_thread_pool(worker->get_thread_pool());
        m_workers.push_back(std::move(worker));
    }

    {
        std::vector<std::jthread> io_worker_threads;
        io_worker_threads.reserve(m_workers.size());
        for (const auto& worker : m_workers) {
            io_worker_threads.emplace_back([w = worker.get()] { w->run(); });
        }
        if (on_listening) {
            on_listening();
        }

        const int signo = m_signals->wait();
        const char* signal_name = strsignal(signo);
        util::log::info("Received signal {} ({}), shutting down.", signo, signal_name ? signal_name : "Unknown");
        m_running = false;
    }

    m_workers.clear();
}
