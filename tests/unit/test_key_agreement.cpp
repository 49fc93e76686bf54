#include <catch2/catch_test_macros.hpp>
#include "peerdrop/protocol/key_agreement.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include <vector>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::crypto;

namespace {
proto::crypto::PublicKeyJwk FreshJwk() {
    auto keypair = KeyAgreement::GenerateKeypair().Unwrap();
    return KeyAgreement::ExportPublicKey(keypair);
}
}

TEST_CASE("KeyAgreement - Both sides derive the same key", "[key_agreement][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto caller = KeyAgreement::GenerateKeypair(peerdrop::debug::Side::Caller).Unwrap();
    auto answerer = KeyAgreement::GenerateKeypair(peerdrop::debug::Side::Answerer).Unwrap();

    auto caller_view = KeyAgreement::ImportPublicKey(KeyAgreement::ExportPublicKey(answerer));
    auto answerer_view = KeyAgreement::ImportPublicKey(KeyAgreement::ExportPublicKey(caller));
    REQUIRE(caller_view.IsOk());
    REQUIRE(answerer_view.IsOk());

    auto caller_key = KeyAgreement::DeriveSharedKey(caller, caller_view.Unwrap());
    auto answerer_key = KeyAgreement::DeriveSharedKey(answerer, answerer_view.Unwrap());
    REQUIRE(caller_key.IsOk());
    REQUIRE(answerer_key.IsOk());
    REQUIRE(caller_key.Unwrap().Matches(answerer_key.Unwrap()));

    SECTION("A ciphertext from one side opens on the other") {
        const std::vector<uint8_t> nonce(12, 0x01);
        const std::vector<uint8_t> plaintext = {'p', 'i', 'n', 'g'};
        auto sealed = caller_key.Unwrap().Encrypt(nonce, plaintext);
        REQUIRE(sealed.IsOk());
        REQUIRE(answerer_key.Unwrap().Decrypt(nonce, sealed.Unwrap()).Unwrap() == plaintext);
    }
    SECTION("A third party derives a different key") {
        auto outsider = KeyAgreement::GenerateKeypair().Unwrap();
        auto outsider_key = KeyAgreement::DeriveSharedKey(outsider, caller_view.Unwrap()).Unwrap();
        REQUIRE_FALSE(outsider_key.Matches(caller_key.Unwrap()));
        REQUIRE(outsider_key.Fingerprint().Unwrap() != caller_key.Unwrap().Fingerprint().Unwrap());
    }
    SECTION("Fingerprints agree on both sides") {
        const auto fingerprint = caller_key.Unwrap().Fingerprint();
        REQUIRE(fingerprint.IsOk());
        REQUIRE(fingerprint.Unwrap().size() == 64);
        REQUIRE(fingerprint.Unwrap() == answerer_key.Unwrap().Fingerprint().Unwrap());
    }
}

TEST_CASE("KeyAgreement - JWK export", "[key_agreement][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keypair = KeyAgreement::GenerateKeypair().Unwrap();
    const auto jwk = KeyAgreement::ExportPublicKey(keypair);
    REQUIRE(jwk.kty() == "EC");
    REQUIRE(jwk.crv() == "P-256");
    REQUIRE(jwk.x().size() == 43);
    REQUIRE(jwk.y().size() == 43);

    auto json = KeyAgreement::ExportPublicKeyJson(keypair);
    REQUIRE(json.IsOk());
    auto reimported = KeyAgreement::ImportPublicKeyJson(json.Unwrap());
    REQUIRE(reimported.IsOk());
    REQUIRE(reimported.Unwrap().Coordinates().x == keypair.PublicCoordinates().x);
    REQUIRE(reimported.Unwrap().Coordinates().y == keypair.PublicCoordinates().y);
}

TEST_CASE("KeyAgreement - Import rejects bad keys", "[key_agreement][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto jwk = FreshJwk();

    SECTION("Wrong key type") {
        jwk.set_kty("OKP");
        auto result = KeyAgreement::ImportPublicKey(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::KeyFormat);
    }
    SECTION("Different curve") {
        jwk.set_crv("P-384");
        auto result = KeyAgreement::ImportPublicKey(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CurveMismatch);
    }
    SECTION("Truncated coordinate") {
        jwk.set_x(jwk.x().substr(0, 20));
        auto result = KeyAgreement::ImportPublicKey(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::KeyFormat);
    }
    SECTION("Not base64url") {
        jwk.set_y("!!not-base64!!");
        auto result = KeyAgreement::ImportPublicKey(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::KeyFormat);
    }
    SECTION("Point off the curve") {
        std::vector<uint8_t> one(32, 0);
        one.back() = 1;
        jwk.set_x(SodiumInterop::Base64UrlEncode(one));
        jwk.set_y(SodiumInterop::Base64UrlEncode(one));
        auto result = KeyAgreement::ImportPublicKey(jwk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::KeyFormat);
    }
    SECTION("Unparseable JSON") {
        auto result = KeyAgreement::ImportPublicKeyJson("{not json");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::KeyFormat);
    }
}
