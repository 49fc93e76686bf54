#include <catch2/catch_test_macros.hpp>
#include "peerdrop/identity/peer_identity.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include <set>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::identity;

TEST_CASE("PeerIdentity - Generated ids", "[identity]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto id = GeneratePeerId();
        REQUIRE(id.size() == 6);
        for (const char c : id) {
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')));
        }
        seen.insert(id);
    }
    REQUIRE(seen.size() > 190);
}

TEST_CASE("PeerIdentity - Normalization", "[identity]") {
    REQUIRE(NormalizePeerId("  k3x9qa\n").Unwrap() == "k3x9qa");
    REQUIRE(NormalizePeerId("abc").Unwrap() == "abc");
    auto blank = NormalizePeerId(" \t ");
    REQUIRE(blank.IsErr());
    REQUIRE(blank.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(NormalizePeerId("").IsErr());
}
