#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace config {

/**
 * @brief Thrown for configuration values that are present and well-formed
 * but unusable (out of range, placeholder origins).
 */
class error : public std::runtime_error {
public:
    explicit error(const std::string& message)
        : std::runtime_error("config: " + message) {}
};

/**
 * @struct server_config
 * @brief Typed configuration, loaded once at startup and passed to the
 * server by const reference.
 */
struct server_config {
    // CORS
    std::string cors_allowed_origins;
    bool cors_allow_credentials{true};
    bool cors_validate_origins{true};

    // Server
    uint16_t port{8080};
    int io_threads{1};
    int pool_size{16};
    size_t queue_capacity{0};
    std::chrono::seconds read_timeout{60};
    size_t max_request_size{5 * 1024 * 1024};
};

/**
 * @brief Reads all settings from the environment through env::get.
 *
 * Unset variables take their defaults.
 * @throws env::error if a value cannot be decrypted or converted.
 * @throws config::error if a value is out of range or the origins string
 * still holds a placeholder.
 */
[[nodiscard]] server_config load();

/**
 * @brief Detects template values left in a deployment
 * ("https://REPLACE_WITH_YOUR_DOMAIN", "your-app.example").
 * Case-insensitive.
 */
[[nodiscard]] bool contains_placeholder(std::string_view value) noexcept;

} // namespace config

#endif // CONFIG_HPP
