#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace peerdrop::protocol::interfaces {

enum class TransportRole {
    Caller,
    Answerer
};

/// Events raised by a negotiated transport. Implementations may call these
/// from their own threads and from inside ITransport calls.
class ITransportObserver {
public:
    virtual ~ITransportObserver() = default;
    virtual void OnLocalCandidate(const std::string& candidate) = 0;
    virtual void OnOpen() = 0;
    virtual void OnClose() = 0;
    virtual void OnError(const std::string& reason) = 0;
    virtual void OnTextMessage(const std::string& text) = 0;
    virtual void OnBinaryMessage(std::vector<uint8_t> data) = 0;
};

/**
 * Bidirectional ordered message channel established through an
 * offer/answer exchange. The caller creates the offer and later applies the
 * answer; the answerer applies the offer and creates the answer.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual Result<std::string, ProtocolFailure> CreateOffer() = 0;
    virtual Result<std::string, ProtocolFailure> CreateAnswer() = 0;
    virtual Result<Unit, ProtocolFailure> SetRemoteDescription(const std::string& description) = 0;
    virtual Result<Unit, ProtocolFailure> AddRemoteCandidate(const std::string& candidate) = 0;
    virtual Result<Unit, ProtocolFailure> SendText(const std::string& text) = 0;
    virtual Result<Unit, ProtocolFailure> SendBinary(std::span<const uint8_t> data) = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
    /// Idempotent. Both ends observe OnClose once.
    virtual void Close() = 0;
};

class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    /// Starts a negotiation context in `role`. The observer is held weakly.
    virtual Result<std::unique_ptr<ITransport>, ProtocolFailure> Negotiate(
        TransportRole role,
        std::shared_ptr<ITransportObserver> observer) = 0;
};
}
