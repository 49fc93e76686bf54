#pragma once

#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peerdrop::protocol::crypto {

/**
 * @brief Interop layer for libsodium primitives used by the transfer protocol
 *
 * Covers library initialization, secure memory, constant-time comparison,
 * the CSPRNG and the text encodings (hex, unpadded base64url) that carry
 * binary values through JSON documents.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * through sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound) noexcept;

    // ========================================================================
    // Encodings
    // ========================================================================

    /**
     * @brief Lowercase hexadecimal rendering of a byte string
     */
    static std::string ToHex(std::span<const uint8_t> data);

    /**
     * @brief URL-safe base64 without padding, the encoding of JWK coordinates
     */
    static std::string Base64UrlEncode(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> Base64UrlDecode(std::string_view text);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
