#include <catch2/catch_test_macros.hpp>
#include "peerdrop/signaling/signaling_codec.hpp"
#include "peerdrop/protocol/key_agreement.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include <optional>
#include <string>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::signaling;

namespace {
proto::crypto::PublicKeyJwk SampleJwk() {
    proto::crypto::PublicKeyJwk jwk;
    jwk.set_kty("EC");
    jwk.set_crv("P-256");
    jwk.set_x("xcoord");
    jwk.set_y("ycoord");
    return jwk;
}
}

TEST_CASE("SignalingCodec - Message types", "[signaling]") {
    REQUIRE(ToWireType(MessageType::Offer) == "offer");
    REQUIRE(ToWireType(MessageType::Answer) == "answer");
    REQUIRE(ToWireType(MessageType::Candidate) == "candidate");
    REQUIRE(ParseMessageType("answer").Unwrap() == MessageType::Answer);
    REQUIRE(ParseMessageType("hangup").UnwrapErr().type == ProtocolFailureType::SignalingParse);
}

TEST_CASE("SignalingCodec - Encode and decode", "[signaling]") {
    SECTION("Offer carries description, target and public key") {
        auto json = SignalingCodec::Encode(
            SignalingCodec::MakeOffer("abc123", "def456", "loopback:offer:lb-1", SampleJwk()));
        REQUIRE(json.IsOk());
        REQUIRE(json.Unwrap().find(R"("senderId":"abc123")") != std::string::npos);
        REQUIRE(json.Unwrap().find(R"("targetId":"def456")") != std::string::npos);
        REQUIRE(json.Unwrap().find(R"("publicKey":{)") != std::string::npos);

        auto decoded = SignalingCodec::Decode(json.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().type == MessageType::Offer);
        REQUIRE(decoded.Unwrap().message.payload() == "loopback:offer:lb-1");
        REQUIRE(decoded.Unwrap().message.public_key().crv() == "P-256");
    }
    SECTION("Candidate needs no public key") {
        auto json = SignalingCodec::Encode(
            SignalingCodec::MakeCandidate("abc123", "def456", "candidate:1 1 udp 1 127.0.0.1 9 typ host"));
        auto decoded = SignalingCodec::Decode(json.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().type == MessageType::Candidate);
    }
}

TEST_CASE("SignalingCodec - Malformed documents", "[signaling]") {
    auto expect_parse_failure = [](const std::string& document) {
        auto decoded = SignalingCodec::Decode(document);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::SignalingParse);
    };
    SECTION("Not JSON") {
        expect_parse_failure("offer from abc");
    }
    SECTION("Unknown type") {
        expect_parse_failure(R"({"type":"bye","senderId":"abc123"})");
    }
    SECTION("Missing sender") {
        expect_parse_failure(R"({"type":"candidate","payload":"candidate:x"})");
    }
    SECTION("Offer without public key") {
        expect_parse_failure(R"({"type":"offer","senderId":"abc123","payload":"sdp"})");
    }
    SECTION("Answer without description") {
        expect_parse_failure(
            R"({"type":"answer","senderId":"abc123","publicKey":{"kty":"EC","crv":"P-256","x":"a","y":"b"}})");
    }
}

TEST_CASE("SignalingCodec - Sender peek", "[signaling]") {
    SECTION("Sender of a document that fails validation") {
        const std::string document = R"({"type":"bogus","senderId":"alice1","publicKey":"not-a-jwk"})";
        REQUIRE(SignalingCodec::Decode(document).IsErr());
        REQUIRE(SignalingCodec::PeekSenderId(document) == std::optional<std::string>("alice1"));
    }
    SECTION("No sender") {
        REQUIRE_FALSE(SignalingCodec::PeekSenderId(R"({"type":"offer"})").has_value());
        REQUIRE_FALSE(SignalingCodec::PeekSenderId("not json").has_value());
    }
}
