#pragma once
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include <utility>
#include <vector>

namespace peerdrop::protocol::test_helpers {

/// Two independent handles over the same random 32-byte secret, as the two
/// ends of a completed handshake would hold.
inline std::pair<crypto::SymmetricKey, crypto::SymmetricKey> MakeMatchingKeys() {
    auto secret = crypto::SodiumInterop::GetRandomBytes(32);
    auto first = crypto::SymmetricKey::FromRawSecret(secret).Unwrap();
    auto second = crypto::SymmetricKey::FromRawSecret(secret).Unwrap();
    return {std::move(first), std::move(second)};
}

inline crypto::SymmetricKey MakeRandomKey() {
    return crypto::SymmetricKey::FromRawSecret(crypto::SodiumInterop::GetRandomBytes(32)).Unwrap();
}

inline std::vector<uint8_t> PatternBytes(size_t size, uint8_t seed = 7) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 131 + seed) & 0xFF);
    }
    return data;
}

}
