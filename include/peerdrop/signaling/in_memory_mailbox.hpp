#pragma once
#include "peerdrop/interfaces/i_signaling_channel.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
namespace peerdrop::protocol::signaling {

/**
 * Process-local mailbox store keyed by "artifacts/{app}/users/{id}/signaling".
 *
 * Subscribers are invoked outside the internal lock on the appending thread,
 * so a callback may re-enter Send or DeleteMessage. Deleting an unknown id
 * succeeds.
 */
class InMemoryMailbox final : public interfaces::ISignalingChannel {
public:
    explicit InMemoryMailbox(std::string app_id);

    Result<std::string, ProtocolFailure> Send(
        const std::string& recipient_id,
        const proto::signaling::SignalingMessage& message) override;

    Result<Unit, ProtocolFailure> DeleteMessage(
        const std::string& owner_id,
        const std::string& message_id) override;

    Result<Subscription, ProtocolFailure> Subscribe(
        const std::string& owner_id,
        EntryCallback on_new_entries) override;

    /// Stores an arbitrary document, bypassing encoding.
    Result<std::string, ProtocolFailure> AppendRaw(
        const std::string& owner_id,
        std::string document);

    [[nodiscard]] std::vector<interfaces::MailboxEntry> Entries(const std::string& owner_id) const;

    [[nodiscard]] std::string MailboxPath(const std::string& owner_id) const;

private:
    struct Subscriber {
        uint64_t id;
        std::string path;
        std::shared_ptr<EntryCallback> callback;
    };
    struct State {
        mutable std::mutex mutex;
        std::map<std::string, std::vector<interfaces::MailboxEntry>> mailboxes;
        std::vector<Subscriber> subscribers;
        uint64_t next_entry_id = 1;
        uint64_t next_subscriber_id = 1;
    };

    std::string app_id_;
    std::shared_ptr<State> state_;
};
}
