#ifndef ENV_HPP
#define ENV_HPP

#include "pkeyutil.hpp"
#include <string>
#include <stdexcept>
#include <concepts>
#include <string_view>
#include <optional>
#include <charconv>
#include <cstdlib>

namespace env {

    /**
     * @brief Exception thrown when an environment variable cannot be resolved
     * into a usable value (decryption or conversion failure).
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string& message)
            : std::runtime_error("env::get: " + message) {}
    };

    /**
     * @brief Thrown when the variable is not set at all. Only this case falls
     * back to a default value.
     */
    class missing_error : public error {
    public:
        explicit missing_error(const std::string& key)
            : error("missing environment variable: " + key) {}
    };

    template <typename T>
    concept Supported = std::same_as<T, std::string> ||
                        std::same_as<T, int> ||
                        std::same_as<T, long> ||
                        std::same_as<T, size_t> ||
                        std::same_as<T, bool>;

    namespace detail {

        template <typename T>
        T convert_number(std::string_view value, const std::string& key, std::string_view type_name) {
            T result{};
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                throw error("invalid " + std::string(type_name) + " for key '" + key + "': " + std::string(value));
            }
            return result;
        }

        template <Supported T>
        T convert(std::string_view value, const std::string& key);

        template <>
        inline std::string convert<std::string>(std::string_view value, const std::string&) {
            return std::string(value);
        }

        template <>
        inline int convert<int>(std::string_view value, const std::string& key) {
            return convert_number<int>(value, key, "int");
        }

        template <>
        inline long convert<long>(std::string_view value, const std::string& key) {
            return convert_number<long>(value, key, "long");
        }

        template <>
        inline size_t convert<size_t>(std::string_view value, const std::string& key) {
            return convert_number<size_t>(value, key, "size_t");
        }

        template <>
        inline bool convert<bool>(std::string_view value, const std::string& key) {
            if (value == "1") return true;
            if (value == "0") return false;
            throw error("invalid bool for key '" + key + "' (expected '0' or '1'): " + std::string(value));
        }

        // Values ending in ".enc" name an RSA-encrypted file holding the real value.
        inline std::string fetch_string(const std::string& key) {
            const char* raw = std::getenv(key.c_str());
            if (!raw) {
                throw missing_error(key);
            }

            std::string value = raw;
            if (value.ends_with(".enc")) {
                const char* key_path = std::getenv("PRIVATE_KEY_PATH");
                auto result = util::decrypt_file(value, key_path ? key_path : "private.pem");
                if (!result) {
                    throw error("decryption failed for file '" + value + "' (from key '" + key + "'): " + result.error());
                }
                value = std::move(*result);
            }
            return value;
        }
    } // namespace detail

    /**
     * @brief Gets an environment variable with type conversion.
     * @throws env::missing_error if unset, env::error if it cannot be resolved.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key) {
        const std::string value = detail::fetch_string(key);
        return detail::convert<T>(value, key);
    }

    /**
     * @brief Gets an environment variable, using the fallback only when it is unset.
     * A value that is present but malformed still throws env::error.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key, const T& fallback) {
        try {
            return get<T>(key);
        } catch (const env::missing_error&) {
            return fallback;
        }
    }
}

#endif // ENV_HPP
