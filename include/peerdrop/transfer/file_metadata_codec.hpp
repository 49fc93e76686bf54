#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "transfer/transfer.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace peerdrop::protocol::transfer {

/// Text control message announcing a file:
/// {"type":"fileMetadata","fileName","fileSize","fileType","fileHash"}
/// with `fileSize` as a JSON number.
class FileMetadataCodec {
public:
    [[nodiscard]] static proto::transfer::FileMetadata Make(
        const std::string& file_name,
        uint64_t file_size,
        const std::string& mime_type,
        const std::string& file_hash);

    [[nodiscard]] static Result<std::string, ProtocolFailure> Encode(
        const proto::transfer::FileMetadata& metadata);

    /// nullopt for text that is not JSON, not a fileMetadata document, or
    /// whose fileSize is not a non-negative integer of at most 2^53.
    [[nodiscard]] static std::optional<proto::transfer::FileMetadata> TryDecode(std::string_view text);

    /// Announced size of a decoded or locally made document.
    [[nodiscard]] static uint64_t FileSize(const proto::transfer::FileMetadata& metadata) noexcept;

private:
    FileMetadataCodec() = delete;
};
}
