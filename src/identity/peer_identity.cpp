#include "peerdrop/identity/peer_identity.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
namespace peerdrop::protocol::identity {

std::string GeneratePeerId() {
    std::string id;
    id.reserve(kPeerIdLength);
    for (size_t i = 0; i < kPeerIdLength; ++i) {
        const uint32_t index = crypto::SodiumInterop::RandomUniform(
            static_cast<uint32_t>(kPeerIdAlphabet.size()));
        id.push_back(kPeerIdAlphabet[index]);
    }
    return id;
}

Result<std::string, ProtocolFailure> NormalizePeerId(std::string_view raw) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const size_t first = raw.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Please enter a valid Peer ID first."));
    }
    const size_t last = raw.find_last_not_of(whitespace);
    return Result<std::string, ProtocolFailure>::Ok(std::string(raw.substr(first, last - first + 1)));
}

}
