#pragma once
#include "peerdrop/interfaces/i_transfer_history.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
namespace peerdrop::protocol::history {

/// "YYYY-MM-DDTHH:MM:SS.mmmZ" in UTC.
[[nodiscard]] std::string FormatTimestamp(std::chrono::system_clock::time_point when);

[[nodiscard]] std::string CurrentTimestamp();

/// Orders by timestamp, newest first. Fixed-width ISO-8601 UTC strings
/// compare chronologically as text.
void SortNewestFirst(std::vector<proto::transfer::TransferRecord>& records);

[[nodiscard]] proto::transfer::TransferRecord MakeRecord(
    const std::string& sender_id,
    const std::string& recipient_id,
    const std::string& file_name,
    const std::string& file_hash);

/// Records grouped under "artifacts/{app}/users/{sender}/fileHistory".
class InMemoryTransferHistory final : public interfaces::ITransferHistory {
public:
    explicit InMemoryTransferHistory(std::string app_id);

    Result<Unit, ProtocolFailure> Append(const proto::transfer::TransferRecord& record) override;

    Result<Subscription, ProtocolFailure> SubscribeAll(
        const std::string& owner_id,
        RecordsCallback on_records) override;

    [[nodiscard]] std::vector<proto::transfer::TransferRecord> Records(const std::string& owner_id) const;

private:
    struct Subscriber {
        uint64_t id;
        std::string path;
        std::shared_ptr<RecordsCallback> callback;
    };
    struct State {
        mutable std::mutex mutex;
        std::map<std::string, std::vector<proto::transfer::TransferRecord>> collections;
        std::vector<Subscriber> subscribers;
        uint64_t next_subscriber_id = 1;
    };

    [[nodiscard]] std::string CollectionPath(const std::string& owner_id) const;

    std::string app_id_;
    std::shared_ptr<State> state_;
};
}
