#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/subscription.hpp"
#include "signaling/signaling.pb.h"
#include <functional>
#include <string>
#include <vector>
namespace peerdrop::protocol::interfaces {

/// One stored document in an identity's mailbox.
struct MailboxEntry {
    std::string id;
    std::string document;
};

/**
 * Addressable per-identity mailbox used to bootstrap a connection.
 *
 * Subscribers receive every entry currently in the mailbox when they
 * subscribe and each newly appended entry afterwards. Entries stay until the
 * owner deletes them. Callbacks may run on any thread.
 */
class ISignalingChannel {
public:
    using EntryCallback = std::function<void(const std::vector<MailboxEntry>&)>;

    virtual ~ISignalingChannel() = default;

    /// Appends `message` to the recipient's mailbox; returns the entry id.
    virtual Result<std::string, ProtocolFailure> Send(
        const std::string& recipient_id,
        const proto::signaling::SignalingMessage& message) = 0;

    virtual Result<Unit, ProtocolFailure> DeleteMessage(
        const std::string& owner_id,
        const std::string& message_id) = 0;

    virtual Result<Subscription, ProtocolFailure> Subscribe(
        const std::string& owner_id,
        EntryCallback on_new_entries) = 0;
};
}
