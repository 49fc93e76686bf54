#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <openssl/types.h>

namespace peerdrop::protocol::crypto {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept;
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// Affine coordinates of an uncompressed P-256 point, big-endian, 32 bytes each.
struct P256Coordinates {
    std::array<uint8_t, 32> x{};
    std::array<uint8_t, 32> y{};
};

/**
 * Validated P-256 public key of a remote peer.
 */
class EcdhPublicKey {
public:
    /**
     * Build from raw coordinates. The point must lie on the curve and not be
     * the identity; anything else is KeyFormat.
     */
    [[nodiscard]] static Result<EcdhPublicKey, ProtocolFailure> FromCoordinates(
        std::span<const uint8_t> x,
        std::span<const uint8_t> y);

    [[nodiscard]] const P256Coordinates& Coordinates() const noexcept { return coordinates_; }
    [[nodiscard]] EVP_PKEY* Handle() const noexcept { return key_.get(); }

private:
    EcdhPublicKey(EvpPkeyPtr key, P256Coordinates coordinates) noexcept
        : key_(std::move(key)), coordinates_(coordinates) {}

    EvpPkeyPtr key_;
    P256Coordinates coordinates_;
};

/**
 * Ephemeral P-256 key pair. The private scalar stays inside the OpenSSL key
 * object and is never exported.
 */
class EcdhKeyPair {
public:
    [[nodiscard]] static Result<EcdhKeyPair, ProtocolFailure> Generate();

    [[nodiscard]] const P256Coordinates& PublicCoordinates() const noexcept { return public_; }

    /**
     * Raw ECDH: the x-coordinate of d·Q, 32 bytes.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ComputeSharedSecret(
        const EcdhPublicKey& peer) const;

private:
    EcdhKeyPair(EvpPkeyPtr key, P256Coordinates pub) noexcept
        : key_(std::move(key)), public_(pub) {}

    EvpPkeyPtr key_;
    P256Coordinates public_;
};

}
