#ifndef HEALTH_HPP
#define HEALTH_HPP

#include "api_router.hpp"
#include <atomic>
#include <string>
#include <string_view>

namespace health {

/**
 * @brief Readiness flag shared between startup code and the readyz handler.
 *
 * Starts false and is flipped by set_ready() once the listening sockets are
 * bound and the I/O threads run.
 */
class readiness {
public:
    void set_ready() noexcept { m_ready.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_ready() const noexcept { return m_ready.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_ready{false};
};

void healthz(const http::request& req, http::response& res);

// 503 {"status":"starting"} until state is ready, then 200 with the version.
// state must outlive the returned handler.
[[nodiscard]] api_handler_func make_readyz(const readiness& state, std::string version);

} // namespace health

#endif // HEALTH_HPP
