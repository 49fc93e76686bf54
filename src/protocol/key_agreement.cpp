#include "peerdrop/protocol/key_agreement.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/serialization/json_codec.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
namespace peerdrop::protocol {
using crypto::EcdhKeyPair;
using crypto::EcdhPublicKey;
using crypto::SodiumInterop;
using crypto::SymmetricKey;
using OpenSSL = OpenSSLConstants;

namespace {
    Result<std::vector<uint8_t>, ProtocolFailure> DecodeCoordinate(
        const std::string& encoded, const char* name) {
        auto decoded = SodiumInterop::Base64UrlDecode(encoded);
        if (decoded.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::KeyFormat(
                    compat::format("JWK coordinate '{}' is not base64url", name)));
        }
        if (decoded.Unwrap().size() != Constants::P256_COORDINATE_SIZE) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::KeyFormat(
                    compat::format("JWK coordinate '{}' must decode to {} bytes, got {}",
                        name, Constants::P256_COORDINATE_SIZE, decoded.Unwrap().size())));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(decoded).Unwrap());
    }
}

Result<EcdhKeyPair, ProtocolFailure> KeyAgreement::GenerateKeypair(const debug::Side side) {
    auto keypair = EcdhKeyPair::Generate();
    if (keypair.IsOk()) {
        const auto& pub = keypair.Unwrap().PublicCoordinates();
        debug::LogKeypairGenerated(side, pub.x, pub.y);
    }
    return keypair;
}

proto::crypto::PublicKeyJwk KeyAgreement::ExportPublicKey(const EcdhKeyPair& keypair) {
    const auto& pub = keypair.PublicCoordinates();
    proto::crypto::PublicKeyJwk jwk;
    jwk.set_kty(std::string(OpenSSL::ALGORITHM_EC));
    jwk.set_crv(std::string(OpenSSL::CURVE_P256));
    jwk.set_x(SodiumInterop::Base64UrlEncode(pub.x));
    jwk.set_y(SodiumInterop::Base64UrlEncode(pub.y));
    return jwk;
}

Result<std::string, ProtocolFailure> KeyAgreement::ExportPublicKeyJson(const EcdhKeyPair& keypair) {
    return serialization::ToJson(ExportPublicKey(keypair));
}

Result<EcdhPublicKey, ProtocolFailure> KeyAgreement::ImportPublicKey(const proto::crypto::PublicKeyJwk& jwk) {
    if (jwk.kty() != OpenSSL::ALGORITHM_EC) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyFormat(
                compat::format("Unsupported JWK key type '{}'", jwk.kty())));
    }
    if (jwk.crv() != OpenSSL::CURVE_P256) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::CurveMismatch(
                compat::format("Expected curve {}, peer sent '{}'", OpenSSL::CURVE_P256, jwk.crv())));
    }
    auto x = DecodeCoordinate(jwk.x(), "x");
    PEERDROP_TRY(x);
    auto y = DecodeCoordinate(jwk.y(), "y");
    PEERDROP_TRY(y);
    return EcdhPublicKey::FromCoordinates(x.Unwrap(), y.Unwrap());
}

Result<EcdhPublicKey, ProtocolFailure> KeyAgreement::ImportPublicKeyJson(std::string_view json) {
    proto::crypto::PublicKeyJwk jwk;
    auto parsed = serialization::FromJson(json, jwk);
    if (parsed.IsErr()) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyFormat(parsed.UnwrapErr().message));
    }
    return ImportPublicKey(jwk);
}

Result<SymmetricKey, ProtocolFailure> KeyAgreement::DeriveSharedKey(
    const EcdhKeyPair& local,
    const EcdhPublicKey& remote,
    const debug::Side side) {
    auto secret_result = local.ComputeSharedSecret(remote);
    PEERDROP_TRY(secret_result);
    std::vector<uint8_t> secret = std::move(secret_result).Unwrap();
    debug::LogSharedSecret(side, secret);
    auto key = SymmetricKey::FromRawSecret(secret);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
    return key;
}

}
