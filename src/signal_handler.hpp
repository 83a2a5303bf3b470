#ifndef SIGNAL_HANDLER_HPP
#define SIGNAL_HANDLER_HPP

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <sys/signalfd.h>
#include <unistd.h>

namespace util {

class signal_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class signal_handler
 * @brief Blocks SIGINT, SIGTERM and SIGQUIT and exposes them through a
 * blocking signalfd, so shutdown is handled synchronously by the main thread.
 *
 * Must be constructed before any other thread starts, since threads inherit
 * the signal mask of their creator.
 */
class signal_handler {
public:
    signal_handler() {
        // A write to a closed socket returns EPIPE instead of killing the process.
        signal(SIGPIPE, SIG_IGN);

        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        sigaddset(&mask, SIGQUIT);

        if (sigprocmask(SIG_BLOCK, &mask, nullptr) == -1) {
            throw signal_error("Failed to set sigprocmask");
        }

        m_fd = signalfd(-1, &mask, 0);
        if (m_fd == -1) {
            throw signal_error("Failed to create signalfd");
        }
    }

    ~signal_handler() {
        if (m_fd != -1) {
            close(m_fd);
        }
    }

    signal_handler(const signal_handler&) = delete;
    signal_handler& operator=(const signal_handler&) = delete;
    signal_handler(signal_handler&&) = delete;
    signal_handler& operator=(signal_handler&&) = delete;

    /**
     * @brief Blocks until one of the shutdown signals arrives.
     * @return The signal number.
     * @throws signal_error if the signalfd cannot be read.
     */
    [[nodiscard]] int wait() const {
        signalfd_siginfo ssi{};
        while (true) {
            const ssize_t bytes_read = read(m_fd, &ssi, sizeof(ssi));
            if (bytes_read == static_cast<ssize_t>(sizeof(ssi))) {
                return static_cast<int>(ssi.ssi_signo);
            }
            if (bytes_read == -1 && errno == EINTR) {
                continue;
            }
            throw signal_error("Failed to read from signalfd");
        }
    }

    [[nodiscard]] int get_fd() const noexcept {
        return m_fd;
    }

private:
    int m_fd{-1};
};

} // namespace util

#endif // SIGNAL_HANDLER_HPP
