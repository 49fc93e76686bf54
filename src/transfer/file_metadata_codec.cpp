#include "peerdrop/transfer/file_metadata_codec.hpp"
#include "peerdrop/serialization/json_codec.hpp"
#include "peerdrop/core/constants.hpp"
#include <cmath>
namespace peerdrop::protocol::transfer {
using proto::transfer::FileMetadata;

FileMetadata FileMetadataCodec::Make(
    const std::string& file_name,
    const uint64_t file_size,
    const std::string& mime_type,
    const std::string& file_hash) {
    FileMetadata metadata;
    metadata.set_type(std::string(kFileMetadataType));
    metadata.set_file_name(file_name);
    metadata.set_file_size(static_cast<double>(file_size));
    metadata.set_file_type(mime_type);
    metadata.set_file_hash(file_hash);
    return metadata;
}

Result<std::string, ProtocolFailure> FileMetadataCodec::Encode(const FileMetadata& metadata) {
    return serialization::ToJson(metadata);
}

std::optional<FileMetadata> FileMetadataCodec::TryDecode(std::string_view text) {
    FileMetadata metadata;
    if (serialization::FromJson(text, metadata).IsErr()) {
        return std::nullopt;
    }
    if (metadata.type() != kFileMetadataType) {
        return std::nullopt;
    }
    const double size = metadata.file_size();
    if (!std::isfinite(size) || size < 0.0 || std::floor(size) != size ||
        size > static_cast<double>(kMaxAnnouncedFileSize)) {
        return std::nullopt;
    }
    return metadata;
}

uint64_t FileMetadataCodec::FileSize(const FileMetadata& metadata) noexcept {
    return static_cast<uint64_t>(metadata.file_size());
}

}
