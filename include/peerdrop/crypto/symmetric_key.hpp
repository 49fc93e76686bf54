#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace peerdrop::protocol::crypto {

/**
 * 256-bit AES-GCM session key held in secure memory.
 *
 * The raw bytes never leave the handle: encryption and comparison operate
 * in place through SecureMemoryHandle::WithReadAccess.
 */
class SymmetricKey {
public:
    [[nodiscard]] static Result<SymmetricKey, ProtocolFailure> FromRawSecret(
        std::span<const uint8_t> secret);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag) const;

    /// Constant-time equality of key material.
    [[nodiscard]] bool Matches(const SymmetricKey& other) const;

    /// SHA-256 of the key bytes as lowercase hex, for comparing keys held by
    /// different owners without handing out the key itself.
    [[nodiscard]] Result<std::string, ProtocolFailure> Fingerprint() const;

    SymmetricKey(SymmetricKey&&) noexcept = default;
    SymmetricKey& operator=(SymmetricKey&&) noexcept = default;
    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;
    ~SymmetricKey() = default;

private:
    explicit SymmetricKey(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}

    SecureMemoryHandle handle_;
};
}
