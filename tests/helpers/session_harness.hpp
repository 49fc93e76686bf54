#pragma once
#include "helpers/recording_event_handler.hpp"
#include "peerdrop/configuration/peer_config.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/history/transfer_history.hpp"
#include "peerdrop/protocol/peer_session.hpp"
#include "peerdrop/signaling/in_memory_mailbox.hpp"
#include "peerdrop/transport/loopback_transport.hpp"
#include <memory>
#include <string>

namespace peerdrop::protocol::test_helpers {

struct PeerUnderTest {
    std::shared_ptr<PeerSession> session;
    std::shared_ptr<RecordingEventHandler> events;
};

/// Peers sharing one in-process mailbox, loopback transport and history.
class SessionHarness {
public:
    explicit SessionHarness(configuration::PeerConfig config = configuration::PeerConfig::Default())
        : config_(std::move(config))
        , mailbox(std::make_shared<signaling::InMemoryMailbox>(config_.AppId()))
        , transports(std::make_shared<transport::LoopbackTransportFactory>())
        , history(std::make_shared<history::InMemoryTransferHistory>(config_.AppId())) {}

    PeerUnderTest AddPeer(const std::string& id, bool start = true) {
        auto events = std::make_shared<RecordingEventHandler>();
        return {AddPeerWithHandler(id, events, start), std::move(events)};
    }

    std::shared_ptr<PeerSession> AddPeerWithHandler(
        const std::string& id,
        std::shared_ptr<interfaces::ISessionEventHandler> handler,
        bool start = true) {
        PeerSession::Dependencies deps{mailbox, transports, history, std::move(handler)};
        auto session = PeerSession::Create(id, std::move(deps), config_).Unwrap();
        if (start) {
            (void)session->Start().Unwrap();
        }
        return session;
    }

    configuration::PeerConfig config_;
    std::shared_ptr<signaling::InMemoryMailbox> mailbox;
    std::shared_ptr<transport::LoopbackTransportFactory> transports;
    std::shared_ptr<history::InMemoryTransferHistory> history;
};

}
