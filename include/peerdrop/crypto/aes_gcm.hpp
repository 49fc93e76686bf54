#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace peerdrop::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Stateless primitive: ciphertext is returned with the 16-byte tag appended,
 * and Decrypt expects the same layout. The caller owns nonce uniqueness.
 * File chunks draw a fresh random 96-bit nonce per chunk (see ChunkFrame),
 * which keeps the collision probability negligible for the number of chunks
 * a single key ever seals.
 *
 * A tag mismatch is reported as ProtocolFailureType::Decryption; malformed
 * key or nonce sizes as InvalidInput.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag);
private:
    AesGcm() = delete;
};
}
