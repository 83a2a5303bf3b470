#ifndef PKEYUTIL_HPP
#define PKEYUTIL_HPP

#include <expected>
#include <string>
#include <string_view>

namespace util {

/**
 * @brief Decrypts a file encrypted with an RSA public key (PKCS#1 v1.5 padding).
 *
 * Used for configuration values that must not live in plain text in the
 * environment, e.g. an origins list pointing at "cors_origins.enc".
 *
 * @param filename The path to the encrypted file.
 * @param private_key_path The PEM private key used for decryption.
 * @return The decrypted text, or an error message.
 */
[[nodiscard]] std::expected<std::string, std::string> decrypt_file(std::string_view filename,
                                                                  std::string_view private_key_path) noexcept;

} // namespace util

#endif // PKEYUTIL_HPP
