#include "config.hpp"
#include "env.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <limits>
#include <thread>

namespace {

constexpr std::array<std::string_view, 5> k_placeholder_markers{
    "REPLACE_WITH", "PLACEHOLDER", "CHANGE-ME", "CHANGE_ME", "YOUR-"};

template <typename T>
T require_positive(const std::string& key, T value) {
    if (value <= 0) {
        throw config::error(std::format("{} must be greater than zero, got {}", key, value));
    }
    return value;
}

} // namespace

namespace config {

bool contains_placeholder(std::string_view value) noexcept {
    const auto icontains = [value](std::string_view marker) {
        return !std::ranges::search(value, marker, [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
        }).empty();
    };
    return std::ranges::any_of(k_placeholder_markers, icontains);
}

server_config load() {
    server_config cfg;

    cfg.cors_allowed_origins = env::get<std::string>("CHATBOX_CORS_ALLOWED_ORIGINS", "");
    cfg.cors_allow_credentials = env::get<bool>("CHATBOX_CORS_ALLOW_CREDENTIALS", true);
    cfg.cors_validate_origins = env::get<bool>("CHATBOX_CORS_VALIDATE_ORIGINS", true);

    if (contains_placeholder(cfg.cors_allowed_origins)) {
        throw error(std::format("CHATBOX_CORS_ALLOWED_ORIGINS contains a placeholder value: '{}'",
                                cfg.cors_allowed_origins));
    }

    const int port = env::get<int>("PORT", 8080);
    if (port < 1 || port > std::numeric_limits<uint16_t>::max()) {
        throw error(std::format("PORT must be in 1..65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);

    const int hw_threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    cfg.io_threads = require_positive("IO_THREADS", env::get<int>("IO_THREADS", hw_threads));
    cfg.pool_size = require_positive("POOL_SIZE", env::get<int>("POOL_SIZE", 16));
    cfg.queue_capacity = env::get<size_t>("QUEUE_CAPACITY", 0);
    cfg.read_timeout = std::chrono::seconds{require_positive("READ_TIMEOUT_SECONDS", env::get<int>("READ_TIMEOUT_SECONDS", 60))};
    cfg.max_request_size = require_positive("MAX_REQUEST_SIZE", env::get<size_t>("MAX_REQUEST_SIZE", server_config{}.max_request_size));

    util::log::debug("Configuration loaded: port {}, {} I/O threads, pool size {}, queue capacity {}, read timeout {}s.",
                     cfg.port, cfg.io_threads, cfg.pool_size, cfg.queue_capacity, cfg.read_timeout.count());
    return cfg;
}

} // namespace config
