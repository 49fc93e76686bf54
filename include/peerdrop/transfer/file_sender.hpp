#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include "peerdrop/interfaces/i_transport.hpp"
#include "peerdrop/interfaces/i_transfer_history.hpp"
#include "peerdrop/transfer/byte_sources.hpp"
#include <cstdint>
#include <functional>
#include <string>
namespace peerdrop::protocol::transfer {

struct SendSummary {
    std::string file_hash;
    uint64_t bytes_sent = 0;
    uint64_t chunks_sent = 0;
    bool history_recorded = false;
};

/**
 * Sender half of the chunked transfer.
 *
 * Order on the wire: metadata text, then one binary frame per chunk. The
 * transfer record is appended to history before the metadata goes out and
 * regardless of how the transfer ends; a history failure is logged and does
 * not stop the send.
 */
class FileSender {
public:
    using ProgressCallback = std::function<void(double percent)>;

    FileSender(size_t chunk_size, interfaces::ITransferHistory* history);

    [[nodiscard]] Result<SendSummary, ProtocolFailure> Send(
        OutgoingFile& file,
        const crypto::SymmetricKey& key,
        interfaces::ITransport& transport,
        const std::string& sender_id,
        const std::string& recipient_id,
        const ProgressCallback& on_progress) const;

    /// Whole-source SHA-256, streamed in chunk-sized reads.
    [[nodiscard]] Result<std::string, ProtocolFailure> DigestSource(interfaces::IByteSource& source) const;

    /// Percentage of `total` covered by `done`, clamped to [0, 100]; 100 for an empty file.
    [[nodiscard]] static double ProgressPercent(uint64_t done, uint64_t total) noexcept;

private:
    size_t chunk_size_;
    interfaces::ITransferHistory* history_;
};
}
