#pragma once
#include "peerdrop/core/failures.hpp"
#include "peerdrop/protocol/connection_status.hpp"
#include <cstdint>
#include <string>
namespace peerdrop::protocol::interfaces {

/// Application callbacks. Invoked on the thread that holds the session's
/// dispatch token; handlers must not block on the session.
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnConnectionStatusChanged(ConnectionStatus status) = 0;
    virtual void OnStatusMessage(const std::string& message) = 0;
    virtual void OnTransferProgress(double percent) = 0;
    virtual void OnFileReceived(const std::string& file_name, uint64_t size) = 0;
    virtual void OnTransferFailed(const ProtocolFailure& failure) = 0;
};
}
