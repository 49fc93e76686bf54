#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace peerdrop::protocol::transfer {

/**
 * Wire frame of one encrypted chunk: bytes [0, 12) are the IV, the rest is
 * AES-256-GCM ciphertext with its tag. No sequence number; frames rely on
 * the transport's in-order delivery.
 */
class ChunkFrame {
public:
    static constexpr size_t kOverhead = 12 + 16;

    /// Encrypts under a fresh random IV.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Seal(
        const crypto::SymmetricKey& key,
        std::span<const uint8_t> plaintext,
        uint64_t chunk_index = 0);

    /// Decryption for a frame too short to hold IV and tag, or one whose tag
    /// does not verify under `key`.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Open(
        const crypto::SymmetricKey& key,
        std::span<const uint8_t> frame);

private:
    ChunkFrame() = delete;
};
}
