#include "pkeyutil.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#include <openssl/pem.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

namespace {
    struct EVP_PKEY_Deleter {
        void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
    };

    struct EVP_PKEY_CTX_Deleter {
        void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
    };

    struct FILE_Deleter {
        void operator()(FILE* f) const {
            if (f) fclose(f);
        }
    };

    using unique_EVP_PKEY = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
    using unique_EVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
    using unique_FILE = std::unique_ptr<FILE, FILE_Deleter>;

    // Strips the trailing newline most editors leave at the end of the plain text.
    void trim_trailing_newlines(std::string& text) {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == '\0')) {
            text.pop_back();
        }
    }
}

namespace util {

std::expected<std::string, std::string> decrypt_file(std::string_view filename, std::string_view private_key_path) noexcept {
    try {
        std::ifstream encrypted_file(std::string(filename), std::ios::binary);
        if (!encrypted_file) {
            return std::unexpected("could not open encrypted file");
        }

        const std::vector<unsigned char> encrypted_data(
            (std::istreambuf_iterator<char>(encrypted_file)),
            std::istreambuf_iterator<char>()
        );
        if (encrypted_data.empty()) {
            return std::unexpected("encrypted file is empty");
        }

        const std::string key_path(private_key_path);
        unique_FILE private_key_file(fopen(key_path.c_str(), "r"));
        if (!private_key_file) {
            return std::unexpected("could not open private key file " + key_path);
        }

        unique_EVP_PKEY evp_private_key(PEM_read_PrivateKey(private_key_file.get(), nullptr, nullptr, nullptr));
        if (!evp_private_key) {
            return std::unexpected("failed to read private key");
        }

        unique_EVP_PKEY_CTX dec_ctx(EVP_PKEY_CTX_new(evp_private_key.get(), nullptr));
        if (!dec_ctx) {
            return std::unexpected("failed to create EVP_PKEY_CTX");
        }
        if (EVP_PKEY_decrypt_init(dec_ctx.get()) <= 0) {
            return std::unexpected("failed to initialize decryption");
        }
        if (EVP_PKEY_CTX_set_rsa_padding(dec_ctx.get(), RSA_PKCS1_PADDING) <= 0) {
            return std::unexpected("failed to set RSA padding");
        }

        size_t decrypted_len = 0;
        if (EVP_PKEY_decrypt(dec_ctx.get(), nullptr, &decrypted_len, encrypted_data.data(), encrypted_data.size()) <= 0) {
            return std::unexpected("failed to determine decrypted data length");
        }

        std::vector<unsigned char> decrypted(decrypted_len);
        if (EVP_PKEY_decrypt(dec_ctx.get(), decrypted.data(), &decrypted_len, encrypted_data.data(), encrypted_data.size()) <= 0) {
            return std::unexpected("decryption failed");
        }

        std::string text(reinterpret_cast<const char*>(decrypted.data()), decrypted_len);
        trim_trailing_newlines(text);
        return text;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("decryption error: ") + e.what());
    }
}

} // namespace util
