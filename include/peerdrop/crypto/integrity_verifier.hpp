#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <sodium.h>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace peerdrop::protocol::crypto {

/**
 * SHA-256 content digests rendered as 64 lowercase hex characters.
 *
 * The one-shot Digest is what both sides of a transfer agree on; the
 * streaming form produces the same value for data fed in pieces.
 */
class IntegrityVerifier {
public:
    [[nodiscard]] static std::string Digest(std::span<const uint8_t> data);

    /// Compares two hex digests without early exit.
    [[nodiscard]] static bool Matches(std::string_view expected, std::string_view actual);

    IntegrityVerifier();

    void Update(std::span<const uint8_t> data);

    /// Returns the digest and resets the state for reuse.
    [[nodiscard]] std::string Finalize();

    [[nodiscard]] uint64_t BytesHashed() const noexcept { return bytes_hashed_; }

private:
    crypto_hash_sha256_state state_{};
    uint64_t bytes_hashed_ = 0;
};
}
