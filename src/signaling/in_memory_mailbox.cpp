#include "peerdrop/signaling/in_memory_mailbox.hpp"
#include "peerdrop/signaling/signaling_codec.hpp"
#include "peerdrop/logging/logger.hpp"
#include "peerdrop/core/format.hpp"
#include <algorithm>
namespace peerdrop::protocol::signaling {
using interfaces::MailboxEntry;

InMemoryMailbox::InMemoryMailbox(std::string app_id)
    : app_id_(std::move(app_id))
    , state_(std::make_shared<State>()) {}

std::string InMemoryMailbox::MailboxPath(const std::string& owner_id) const {
    return compat::format("artifacts/{}/users/{}/signaling", app_id_, owner_id);
}

Result<std::string, ProtocolFailure> InMemoryMailbox::Send(
    const std::string& recipient_id,
    const proto::signaling::SignalingMessage& message) {
    auto document = SignalingCodec::Encode(message);
    PEERDROP_TRY(document);
    return AppendRaw(recipient_id, std::move(document).Unwrap());
}

Result<std::string, ProtocolFailure> InMemoryMailbox::AppendRaw(
    const std::string& owner_id,
    std::string document) {
    if (owner_id.empty()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Mailbox owner id must not be empty"));
    }
    const std::string path = MailboxPath(owner_id);
    MailboxEntry entry;
    std::vector<std::shared_ptr<EntryCallback>> targets;
    {
        std::lock_guard lock(state_->mutex);
        entry.id = compat::format("msg-{}", state_->next_entry_id++);
        entry.document = std::move(document);
        state_->mailboxes[path].push_back(entry);
        for (const auto& subscriber : state_->subscribers) {
            if (subscriber.path == path) {
                targets.push_back(subscriber.callback);
            }
        }
    }
    logging::GetLogger()->trace("mailbox {} <- {}", path, entry.id);
    const std::vector<MailboxEntry> batch{entry};
    for (const auto& callback : targets) {
        (*callback)(batch);
    }
    return Result<std::string, ProtocolFailure>::Ok(entry.id);
}

Result<Unit, ProtocolFailure> InMemoryMailbox::DeleteMessage(
    const std::string& owner_id,
    const std::string& message_id) {
    std::lock_guard lock(state_->mutex);
    auto it = state_->mailboxes.find(MailboxPath(owner_id));
    if (it != state_->mailboxes.end()) {
        auto& entries = it->second;
        entries.erase(
            std::remove_if(entries.begin(), entries.end(),
                [&](const MailboxEntry& e) { return e.id == message_id; }),
            entries.end());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Subscription, ProtocolFailure> InMemoryMailbox::Subscribe(
    const std::string& owner_id,
    EntryCallback on_new_entries) {
    if (!on_new_entries) {
        return Result<Subscription, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Mailbox subscriber callback is empty"));
    }
    const std::string path = MailboxPath(owner_id);
    auto callback = std::make_shared<EntryCallback>(std::move(on_new_entries));
    uint64_t subscriber_id = 0;
    std::vector<MailboxEntry> existing;
    {
        std::lock_guard lock(state_->mutex);
        subscriber_id = state_->next_subscriber_id++;
        state_->subscribers.push_back(Subscriber{subscriber_id, path, callback});
        if (auto it = state_->mailboxes.find(path); it != state_->mailboxes.end()) {
            existing = it->second;
        }
    }
    std::weak_ptr<State> weak_state = state_;
    Subscription subscription([weak_state, subscriber_id]() {
        if (auto state = weak_state.lock()) {
            std::lock_guard lock(state->mutex);
            auto& subs = state->subscribers;
            subs.erase(
                std::remove_if(subs.begin(), subs.end(),
                    [&](const Subscriber& s) { return s.id == subscriber_id; }),
                subs.end());
        }
    });
    if (!existing.empty()) {
        (*callback)(existing);
    }
    return Result<Subscription, ProtocolFailure>::Ok(std::move(subscription));
}

std::vector<MailboxEntry> InMemoryMailbox::Entries(const std::string& owner_id) const {
    std::lock_guard lock(state_->mutex);
    auto it = state_->mailboxes.find(MailboxPath(owner_id));
    if (it == state_->mailboxes.end()) {
        return {};
    }
    return it->second;
}

}
