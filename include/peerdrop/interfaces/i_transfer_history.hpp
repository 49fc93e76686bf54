#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/subscription.hpp"
#include "transfer/transfer.pb.h"
#include <functional>
#include <string>
#include <vector>
namespace peerdrop::protocol::interfaces {

/// Append-only sink of TransferRecords, grouped by sender.
class ITransferHistory {
public:
    using RecordsCallback = std::function<void(const std::vector<proto::transfer::TransferRecord>&)>;

    virtual ~ITransferHistory() = default;

    virtual Result<Unit, ProtocolFailure> Append(const proto::transfer::TransferRecord& record) = 0;

    /// Delivers the owner's records, newest first, now and on every append.
    virtual Result<Subscription, ProtocolFailure> SubscribeAll(
        const std::string& owner_id,
        RecordsCallback on_records) = 0;
};
}
