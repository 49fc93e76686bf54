#pragma once
#include "peerdrop/interfaces/i_transport.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
namespace peerdrop::protocol::transport {

/**
 * In-process transport pairing two negotiation contexts from the same factory.
 *
 * Descriptions are opaque tokens ("loopback:offer:lb-N", "loopback:answer:lb-M").
 * Each side announces one host candidate after creating its description. The
 * link opens when the caller applies the answer; both observers then see
 * OnOpen. Sends are delivered synchronously, in order, to the peer observer.
 */
class LoopbackTransportFactory final : public interfaces::ITransportFactory {
public:
    LoopbackTransportFactory();
    ~LoopbackTransportFactory() override;

    Result<std::unique_ptr<interfaces::ITransport>, ProtocolFailure> Negotiate(
        interfaces::TransportRole role,
        std::shared_ptr<interfaces::ITransportObserver> observer) override;

    /// Fails every open link: OnError(reason) then OnClose on both ends.
    void DropAllLinks(const std::string& reason);

    [[nodiscard]] size_t OpenLinkCount() const;

    struct Endpoint;
    struct Registry;

private:
    std::shared_ptr<Registry> registry_;
};

}
