#include <catch2/catch_test_macros.hpp>
#include "helpers/test_keys.hpp"
#include "peerdrop/transfer/chunk_frame.hpp"
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::transfer;
using namespace peerdrop::protocol::test_helpers;

TEST_CASE("ChunkFrame - Seal and open", "[chunk_frame][transfer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [sender_key, receiver_key] = MakeMatchingKeys();
    const auto plaintext = PatternBytes(16384);

    auto frame = ChunkFrame::Seal(sender_key, plaintext);
    REQUIRE(frame.IsOk());
    REQUIRE(frame.Unwrap().size() == plaintext.size() + ChunkFrame::kOverhead);

    auto opened = ChunkFrame::Open(receiver_key, frame.Unwrap());
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);

    SECTION("Each frame carries a fresh IV") {
        auto again = ChunkFrame::Seal(sender_key, plaintext).Unwrap();
        REQUIRE(std::vector<uint8_t>(again.begin(), again.begin() + 12) !=
                std::vector<uint8_t>(frame.Unwrap().begin(), frame.Unwrap().begin() + 12));
    }
    SECTION("Empty chunk is a bare IV and tag") {
        auto empty = ChunkFrame::Seal(sender_key, {}).Unwrap();
        REQUIRE(empty.size() == ChunkFrame::kOverhead);
        REQUIRE(ChunkFrame::Open(receiver_key, empty).Unwrap().empty());
    }
}

TEST_CASE("ChunkFrame - Rejected frames", "[chunk_frame][transfer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto key = MakeRandomKey();
    auto frame = ChunkFrame::Seal(key, PatternBytes(100)).Unwrap();

    SECTION("Different key") {
        auto other = MakeRandomKey();
        auto result = ChunkFrame::Open(other, frame);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Decryption);
    }
    SECTION("Flipped IV bit") {
        frame[0] ^= 0x80;
        REQUIRE(ChunkFrame::Open(key, frame).UnwrapErr().type == ProtocolFailureType::Decryption);
    }
    SECTION("Frame shorter than IV and tag") {
        std::vector<uint8_t> runt(ChunkFrame::kOverhead - 1, 0);
        REQUIRE(ChunkFrame::Open(key, runt).UnwrapErr().type == ProtocolFailureType::Decryption);
    }
}
