#include <catch2/catch_test_macros.hpp>
#include "peerdrop/crypto/aes_gcm.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::crypto;

TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0xAA);
    std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0xBB);
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o'};
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == plaintext.size() + Constants::AES_GCM_TAG_SIZE);
        auto decrypted = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        auto ciphertext = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(ciphertext.Unwrap().size() == Constants::AES_GCM_TAG_SIZE);
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext.Unwrap()).Unwrap().empty());
    }
}

TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x66);
    std::vector<uint8_t> nonce(Constants::AES_GCM_NONCE_SIZE, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();

    auto expect_decryption_failure = [&](const std::vector<uint8_t>& k,
                                         const std::vector<uint8_t>& n,
                                         const std::vector<uint8_t>& ct) {
        auto result = AesGcm::Decrypt(k, n, ct);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Decryption);
    };
    SECTION("Wrong key") {
        expect_decryption_failure(std::vector<uint8_t>(Constants::AES_KEY_SIZE, 0x99), nonce, ciphertext);
    }
    SECTION("Wrong nonce") {
        expect_decryption_failure(key, std::vector<uint8_t>(Constants::AES_GCM_NONCE_SIZE, 0x88), ciphertext);
    }
    SECTION("Tampered ciphertext") {
        auto tampered = ciphertext;
        tampered[0] ^= 0x01;
        expect_decryption_failure(key, nonce, tampered);
    }
    SECTION("Tampered tag") {
        auto tampered = ciphertext;
        tampered.back() ^= 0x01;
        expect_decryption_failure(key, nonce, tampered);
    }
    SECTION("Input shorter than a tag") {
        expect_decryption_failure(key, nonce, std::vector<uint8_t>(10, 0));
    }
}

TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Short key") {
        auto result = AesGcm::Encrypt(std::vector<uint8_t>(16, 0), std::vector<uint8_t>(12, 0), plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Long nonce") {
        auto result = AesGcm::Encrypt(std::vector<uint8_t>(32, 0), std::vector<uint8_t>(16, 0), plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
