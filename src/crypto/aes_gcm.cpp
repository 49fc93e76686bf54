#include "peerdrop/crypto/aes_gcm.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
namespace peerdrop::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    Result<EVP_CIPHER_CTX_ptr, ProtocolFailure> CreateContext(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr,
                              encrypt ? 1 : 0) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(),
                              encrypt ? 1 : 0) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
        }
        return Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>::Ok(std::move(ctx));
    }
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext) {
    PEERDROP_TRY(ValidateKeyAndNonce(key, nonce));
    auto ctx_result = CreateContext(true, key, nonce);
    PEERDROP_TRY(ctx_result);
    EVP_CIPHER_CTX_ptr ctx = std::move(ctx_result).Unwrap();
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag) {
    PEERDROP_TRY(ValidateKeyAndNonce(key, nonce));
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    auto ctx_result = CreateContext(false, key, nonce);
    PEERDROP_TRY(ctx_result);
    EVP_CIPHER_CTX_ptr ctx = std::move(ctx_result).Unwrap();
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        ERR_clear_error();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                std::string(ErrorMessages::AES_GCM_AUTHENTICATION_FAILED)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
}
