#pragma once
#include "peerdrop/crypto/ecdh_p256.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include "peerdrop/interfaces/i_transport.hpp"
#include "peerdrop/protocol/connection_status.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
namespace peerdrop::protocol {

/// Per-session key material and negotiation state. Owned by PeerSession and
/// mutated only on the dispatch token.
struct SessionState {
    SessionRole role = SessionRole::None;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<crypto::EcdhKeyPair> local_keypair;
    std::optional<crypto::EcdhPublicKey> remote_public_key;
    std::optional<crypto::SymmetricKey> shared_key;
    std::unique_ptr<interfaces::ITransport> transport;
    /// Epoch of the bound transport, 0 when none. Events carrying any other
    /// epoch come from a dropped transport and are ignored.
    uint64_t transport_epoch = 0;
    std::string remote_peer_id;

    [[nodiscard]] bool HasNegotiation() const noexcept { return transport != nullptr; }

    /// Drops keys and transport together.
    void Reset() {
        role = SessionRole::None;
        status = ConnectionStatus::Disconnected;
        local_keypair.reset();
        remote_public_key.reset();
        shared_key.reset();
        transport.reset();
        transport_epoch = 0;
        remote_peer_id.clear();
    }
};
}
