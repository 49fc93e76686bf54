#include "peerdrop/crypto/symmetric_key.hpp"
#include "peerdrop/crypto/aes_gcm.hpp"
#include "peerdrop/crypto/integrity_verifier.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
namespace peerdrop::protocol::crypto {

Result<SymmetricKey, ProtocolFailure> SymmetricKey::FromRawSecret(std::span<const uint8_t> secret) {
    if (secret.size() != Constants::AES_KEY_SIZE) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("Shared secret must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, secret.size())));
    }
    auto handle_result = SecureMemoryHandle::Allocate(Constants::AES_KEY_SIZE)
        .MapErr([](const SodiumFailure& f) { return ProtocolFailure::FromSodiumFailure(f); });
    PEERDROP_TRY(handle_result);
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(secret)
        .MapErr([](const SodiumFailure& f) { return ProtocolFailure::FromSodiumFailure(f); });
    PEERDROP_TRY(write_result);
    return Result<SymmetricKey, ProtocolFailure>::Ok(SymmetricKey(std::move(handle)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricKey::Encrypt(
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext) const {
    auto access = handle_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Encrypt(key, nonce, plaintext);
    });
    if (access.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return std::move(access).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricKey::Decrypt(
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag) const {
    auto access = handle_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Decrypt(key, nonce, ciphertext_with_tag);
    });
    if (access.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return std::move(access).Unwrap();
}

bool SymmetricKey::Matches(const SymmetricKey& other) const {
    auto outcome = handle_.WithReadAccess([&](std::span<const uint8_t> mine) {
        auto inner = other.handle_.WithReadAccess([&](std::span<const uint8_t> theirs) {
            auto equal = SodiumInterop::ConstantTimeEquals(mine, theirs);
            return equal.IsOk() && equal.Unwrap();
        });
        return inner.IsOk() && inner.Unwrap();
    });
    return outcome.IsOk() && outcome.Unwrap();
}

Result<std::string, ProtocolFailure> SymmetricKey::Fingerprint() const {
    auto access = handle_.WithReadAccess([](std::span<const uint8_t> key) {
        return IntegrityVerifier::Digest(key);
    });
    if (access.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(access).Unwrap());
}

}
