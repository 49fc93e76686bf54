#include "peerdrop/crypto/integrity_verifier.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include <array>
namespace peerdrop::protocol::crypto {

std::string IntegrityVerifier::Digest(std::span<const uint8_t> data) {
    std::array<uint8_t, Constants::SHA256_DIGEST_SIZE> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return SodiumInterop::ToHex(digest);
}

bool IntegrityVerifier::Matches(std::string_view expected, std::string_view actual) {
    const auto as_bytes = [](std::string_view text) {
        return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    };
    auto equal = SodiumInterop::ConstantTimeEquals(as_bytes(expected), as_bytes(actual));
    return equal.IsOk() && equal.Unwrap();
}

IntegrityVerifier::IntegrityVerifier() {
    crypto_hash_sha256_init(&state_);
}

void IntegrityVerifier::Update(std::span<const uint8_t> data) {
    if (data.empty()) {
        return;
    }
    crypto_hash_sha256_update(&state_, data.data(), data.size());
    bytes_hashed_ += data.size();
}

std::string IntegrityVerifier::Finalize() {
    std::array<uint8_t, Constants::SHA256_DIGEST_SIZE> digest{};
    crypto_hash_sha256_final(&state_, digest.data());
    crypto_hash_sha256_init(&state_);
    bytes_hashed_ = 0;
    return SodiumInterop::ToHex(digest);
}

}
