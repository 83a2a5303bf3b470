#ifndef SOCKET_BUFFER_HPP
#define SOCKET_BUFFER_HPP

#include <string>
#include <vector>
#include <string_view>
#include <sys/types.h> // For ssize_t
#include <algorithm>   // For std::min
#include <span>

/**
 * @class socket_buffer
 * @brief Growable receive buffer. Grows in 4 KiB chunks once three quarters
 * are used, up to a hard limit that protects the server from oversized requests.
 */
class socket_buffer {
public:
    static constexpr size_t k_default_max_size{5 * 1024 * 1024};

    explicit socket_buffer(size_t max_size = k_default_max_size)
        : m_max_size(std::max(max_size, k_chunk_size)) {}

    /**
     * @brief Advances the write position after a read. Once the limit is
     * reached buffer() returns an empty span and the caller must give up.
     */
    void update_pos(ssize_t n) {
        if (n <= 0) return;

        m_pos = std::min(m_pos + static_cast<size_t>(n), m_buffer.size());

        if (m_pos * 4 > m_buffer.size() * 3 && m_buffer.size() < m_max_size) {
            m_buffer.resize(std::min(m_buffer.size() + k_chunk_size, m_max_size));
        }
    }

    [[nodiscard]] std::span<char> buffer() noexcept {
        return {m_buffer.data() + m_pos, available_size()};
    }

    [[nodiscard]] size_t available_size() const noexcept {
        return m_buffer.size() - m_pos;
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_pos == 0;
    }

    [[nodiscard]] size_t size() const noexcept {
        return m_pos;
    }

    [[nodiscard]] size_t max_size() const noexcept {
        return m_max_size;
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {m_buffer.data(), m_pos};
    }

private:
    static constexpr size_t k_chunk_size{4096};

    size_t m_max_size;
    std::vector<char> m_buffer = std::vector<char>(k_chunk_size, 0);
    size_t m_pos{0};
};

#endif // SOCKET_BUFFER_HPP
