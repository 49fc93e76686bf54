#include "peerdrop/history/transfer_history.hpp"
#include "peerdrop/core/format.hpp"
#include <algorithm>
#include <ctime>
namespace peerdrop::protocol::history {
using proto::transfer::TransferRecord;

std::string FormatTimestamp(const std::chrono::system_clock::time_point when) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count();
    const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, millis % 1000);
}

std::string CurrentTimestamp() {
    return FormatTimestamp(std::chrono::system_clock::now());
}

void SortNewestFirst(std::vector<TransferRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
        [](const TransferRecord& a, const TransferRecord& b) {
            return a.timestamp() > b.timestamp();
        });
}

TransferRecord MakeRecord(
    const std::string& sender_id,
    const std::string& recipient_id,
    const std::string& file_name,
    const std::string& file_hash) {
    TransferRecord record;
    record.set_sender_id(sender_id);
    record.set_recipient_id(recipient_id);
    record.set_file_name(file_name);
    record.set_file_hash(file_hash);
    record.set_timestamp(CurrentTimestamp());
    return record;
}

InMemoryTransferHistory::InMemoryTransferHistory(std::string app_id)
    : app_id_(std::move(app_id))
    , state_(std::make_shared<State>()) {}

std::string InMemoryTransferHistory::CollectionPath(const std::string& owner_id) const {
    return compat::format("artifacts/{}/users/{}/fileHistory", app_id_, owner_id);
}

Result<Unit, ProtocolFailure> InMemoryTransferHistory::Append(const TransferRecord& record) {
    if (record.sender_id().empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Transfer record has no sender"));
    }
    const std::string path = CollectionPath(record.sender_id());
    std::vector<TransferRecord> snapshot;
    std::vector<std::shared_ptr<RecordsCallback>> targets;
    {
        std::lock_guard lock(state_->mutex);
        auto& records = state_->collections[path];
        records.push_back(record);
        snapshot = records;
        for (const auto& subscriber : state_->subscribers) {
            if (subscriber.path == path) {
                targets.push_back(subscriber.callback);
            }
        }
    }
    SortNewestFirst(snapshot);
    for (const auto& callback : targets) {
        (*callback)(snapshot);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Subscription, ProtocolFailure> InMemoryTransferHistory::SubscribeAll(
    const std::string& owner_id,
    RecordsCallback on_records) {
    if (!on_records) {
        return Result<Subscription, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("History subscriber callback is empty"));
    }
    const std::string path = CollectionPath(owner_id);
    auto callback = std::make_shared<RecordsCallback>(std::move(on_records));
    uint64_t subscriber_id = 0;
    std::vector<TransferRecord> snapshot;
    {
        std::lock_guard lock(state_->mutex);
        subscriber_id = state_->next_subscriber_id++;
        state_->subscribers.push_back(Subscriber{subscriber_id, path, callback});
        if (auto it = state_->collections.find(path); it != state_->collections.end()) {
            snapshot = it->second;
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
    SortNewestFirst(snapshot);
    (*callback)(snapshot);
    return Result<Subscription, ProtocolFailure>::Ok(std::move(subscription));
}

std::vector<TransferRecord> InMemoryTransferHistory::Records(const std::string& owner_id) const {
    std::vector<TransferRecord> records;
    {
        std::lock_guard lock(state_->mutex);
        if (auto it = state_->collections.find(CollectionPath(owner_id)); it != state_->collections.end()) {
            records = it->second;
        }
    }
    SortNewestFirst(records);
    return records;
}

}
