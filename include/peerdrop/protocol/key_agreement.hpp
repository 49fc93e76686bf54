#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/ecdh_p256.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include "peerdrop/debug/key_logger.hpp"
#include "crypto/public_key.pb.h"
#include <string>
#include <string_view>
namespace peerdrop::protocol {

/**
 * Ephemeral P-256 key agreement.
 *
 * Public keys travel as JWK documents ({"kty":"EC","crv":"P-256","x","y"}).
 * The 32-byte ECDH output is installed directly as the AES-256-GCM session
 * key, so both sides end up with bit-identical keys without a KDF step.
 */
class KeyAgreement {
public:
    [[nodiscard]] static Result<crypto::EcdhKeyPair, ProtocolFailure> GenerateKeypair(
        debug::Side side = debug::Side::Unknown);

    [[nodiscard]] static proto::crypto::PublicKeyJwk ExportPublicKey(const crypto::EcdhKeyPair& keypair);

    [[nodiscard]] static Result<std::string, ProtocolFailure> ExportPublicKeyJson(
        const crypto::EcdhKeyPair& keypair);

    /// KeyFormat for a malformed blob or an off-curve point, CurveMismatch
    /// when `crv` names a different curve.
    [[nodiscard]] static Result<crypto::EcdhPublicKey, ProtocolFailure> ImportPublicKey(
        const proto::crypto::PublicKeyJwk& jwk);

    [[nodiscard]] static Result<crypto::EcdhPublicKey, ProtocolFailure> ImportPublicKeyJson(
        std::string_view json);

    [[nodiscard]] static Result<crypto::SymmetricKey, ProtocolFailure> DeriveSharedKey(
        const crypto::EcdhKeyPair& local,
        const crypto::EcdhPublicKey& remote,
        debug::Side side = debug::Side::Unknown);

private:
    KeyAgreement() = delete;
};
}
