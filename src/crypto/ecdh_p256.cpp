#include "peerdrop/crypto/ecdh_p256.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <algorithm>
#include <string>
namespace peerdrop::protocol::crypto {
using OpenSSL = OpenSSLConstants;

void EvpPkeyDeleter::operator()(EVP_PKEY* key) const noexcept {
    if (key) {
        EVP_PKEY_free(key);
    }
}

namespace {
    struct EvpPkeyCtxDeleter {
        void operator()(EVP_PKEY_CTX* ctx) const { if (ctx) EVP_PKEY_CTX_free(ctx); }
    };
    struct BignumDeleter {
        void operator()(BIGNUM* bn) const { if (bn) BN_free(bn); }
    };
    struct ParamBldDeleter {
        void operator()(OSSL_PARAM_BLD* bld) const { if (bld) OSSL_PARAM_BLD_free(bld); }
    };
    struct ParamDeleter {
        void operator()(OSSL_PARAM* params) const { if (params) OSSL_PARAM_free(params); }
    };
    using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
    using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
    using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
    using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    bool ExportCoordinate(EVP_PKEY* key, const char* param, std::array<uint8_t, 32>& out) {
        BIGNUM* raw = nullptr;
        if (EVP_PKEY_get_bn_param(key, param, &raw) != OpenSSL::SUCCESS) {
            return false;
        }
        BignumPtr bn(raw);
        return BN_bn2binpad(bn.get(), out.data(), static_cast<int>(out.size())) ==
               static_cast<int>(out.size());
    }
}

Result<EcdhPublicKey, ProtocolFailure> EcdhPublicKey::FromCoordinates(
    std::span<const uint8_t> x,
    std::span<const uint8_t> y) {
    if (x.size() != Constants::P256_COORDINATE_SIZE || y.size() != Constants::P256_COORDINATE_SIZE) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyFormat(
                compat::format("P-256 coordinates must be {} bytes, got x={} y={}",
                    Constants::P256_COORDINATE_SIZE, x.size(), y.size())));
    }
    std::array<uint8_t, Constants::P256_UNCOMPRESSED_POINT_SIZE> point{};
    point[0] = Constants::P256_UNCOMPRESSED_POINT_TAG;
    std::copy(x.begin(), x.end(), point.begin() + 1);
    std::copy(y.begin(), y.end(), point.begin() + 1 + Constants::P256_COORDINATE_SIZE);

    const std::string group(OpenSSL::GROUP_PRIME256V1);
    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld ||
        OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, group.c_str(), 0) != OpenSSL::SUCCESS ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()) != OpenSSL::SUCCESS) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to build key parameters: {}", GetOpenSSLError())));
    }
    ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    const std::string algorithm(OpenSSL::ALGORITHM_EC);
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, algorithm.c_str(), nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSL::SUCCESS) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Failed to prepare key import: {}", GetOpenSSLError())));
    }
    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY, params.get()) != OpenSSL::SUCCESS) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyFormat(
                compat::format("Public key is not a valid P-256 point: {}", GetOpenSSLError())));
    }
    EvpPkeyPtr key(raw_key);
    EvpPkeyCtxPtr check_ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr));
    if (!check_ctx || EVP_PKEY_public_check(check_ctx.get()) != OpenSSL::SUCCESS) {
        return Result<EcdhPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyFormat(
                compat::format("Public key failed curve validation: {}", GetOpenSSLError())));
    }
    P256Coordinates coordinates;
    std::copy(x.begin(), x.end(), coordinates.x.begin());
    std::copy(y.begin(), y.end(), coordinates.y.begin());
    return Result<EcdhPublicKey, ProtocolFailure>::Ok(EcdhPublicKey(std::move(key), coordinates));
}

Result<EcdhKeyPair, ProtocolFailure> EcdhKeyPair::Generate() {
    const std::string curve(OpenSSL::CURVE_P256);
    EvpPkeyPtr key(EVP_EC_gen(curve.c_str()));
    if (!key) {
        return Result<EcdhKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(
                compat::format("Failed to generate P-256 key pair: {}", GetOpenSSLError())));
    }
    P256Coordinates pub;
    if (!ExportCoordinate(key.get(), OSSL_PKEY_PARAM_EC_PUB_X, pub.x) ||
        !ExportCoordinate(key.get(), OSSL_PKEY_PARAM_EC_PUB_Y, pub.y)) {
        return Result<EcdhKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(
                compat::format("Failed to export public coordinates: {}", GetOpenSSLError())));
    }
    return Result<EcdhKeyPair, ProtocolFailure>::Ok(EcdhKeyPair(std::move(key), pub));
}

Result<std::vector<uint8_t>, ProtocolFailure> EcdhKeyPair::ComputeSharedSecret(
    const EcdhPublicKey& peer) const {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_.get(), nullptr));
    if (!ctx ||
        EVP_PKEY_derive_init(ctx.get()) != OpenSSL::SUCCESS ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer.Handle()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Failed to initialize ECDH: {}", GetOpenSSLError())));
    }
    size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) != OpenSSL::SUCCESS ||
        secret_len != Constants::P256_SHARED_SECRET_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Unexpected ECDH output length: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("ECDH derivation failed: {}", GetOpenSSLError())));
    }
    secret.resize(secret_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(secret));
}

}
