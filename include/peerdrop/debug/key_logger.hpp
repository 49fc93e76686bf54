#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of key material and chunk IVs.
 *
 * SECURITY WARNING: with PEERDROP_DEBUG_KEYS defined this logs raw ECDH
 * secrets. It exists to compare derivations between two peers during interop
 * debugging. Never enable in a release build.
 *
 * Enable via CMake: -DPEERDROP_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <span>

#ifdef PEERDROP_DEBUG_KEYS
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/logging/logger.hpp"
#endif

namespace peerdrop::debug {

enum class Side {
    Caller,
    Answerer,
    Unknown
};

#ifdef PEERDROP_DEBUG_KEYS

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Caller: return "CALLER";
        case Side::Answerer: return "ANSWERER";
        default: return "UNKNOWN";
    }
}

#define PEERDROP_LOG_KEY(side, operation, key_name, data) \
    ::peerdrop::logging::GetLogger()->warn("[KEYS] {} {} {}: {}", \
        ::peerdrop::debug::SideToString(side), \
        operation, \
        key_name, \
        ::peerdrop::protocol::crypto::SodiumInterop::ToHex(data))

inline void LogKeypairGenerated(
    Side side,
    std::span<const uint8_t> public_x,
    std::span<const uint8_t> public_y) {
    PEERDROP_LOG_KEY(side, "KEYPAIR", "public_x", public_x);
    PEERDROP_LOG_KEY(side, "KEYPAIR", "public_y", public_y);
}

inline void LogSharedSecret(Side side, std::span<const uint8_t> secret) {
    PEERDROP_LOG_KEY(side, "ECDH", "shared_secret", secret);
}

inline void LogChunkIv(Side side, uint64_t chunk_index, std::span<const uint8_t> iv) {
    ::peerdrop::logging::GetLogger()->warn("[KEYS] {} CHUNK iv[{}]: {}",
        SideToString(side), chunk_index,
        ::peerdrop::protocol::crypto::SodiumInterop::ToHex(iv));
}

#else

inline void LogKeypairGenerated(Side, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSharedSecret(Side, std::span<const uint8_t>) {}
inline void LogChunkIv(Side, uint64_t, std::span<const uint8_t>) {}

#endif

}
