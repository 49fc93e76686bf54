#include "peerdrop/transfer/byte_sources.hpp"
#include "peerdrop/core/format.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>
namespace peerdrop::protocol::transfer {

Result<size_t, ProtocolFailure> MemoryByteSource::ReadAt(const uint64_t offset, std::span<uint8_t> out) {
    if (offset > content_.size()) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Read offset {} past end of {} bytes", offset, content_.size())));
    }
    const size_t count = static_cast<size_t>(std::min<uint64_t>(out.size(), content_.size() - offset));
    if (count > 0) {
        std::memcpy(out.data(), content_.data() + offset, count);
    }
    return Result<size_t, ProtocolFailure>::Ok(count);
}

Result<std::unique_ptr<FileByteSource>, ProtocolFailure> FileByteSource::Open(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Result<std::unique_ptr<FileByteSource>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Cannot stat '{}': {}", path, ec.message())));
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Result<std::unique_ptr<FileByteSource>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("Cannot open '{}'", path)));
    }
    return Result<std::unique_ptr<FileByteSource>, ProtocolFailure>::Ok(
        std::unique_ptr<FileByteSource>(new FileByteSource(std::move(stream), size)));
}

Result<size_t, ProtocolFailure> FileByteSource::ReadAt(const uint64_t offset, std::span<uint8_t> out) {
    if (offset > size_) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Read offset {} past end of {} bytes", offset, size_)));
    }
    const size_t count = static_cast<size_t>(std::min<uint64_t>(out.size(), size_ - offset));
    if (count == 0) {
        return Result<size_t, ProtocolFailure>::Ok(0);
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(count));
    const auto read = static_cast<size_t>(stream_.gcount());
    if (read != count) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::Generic(
                compat::format("Short read at offset {}: wanted {}, got {}", offset, count, read)));
    }
    return Result<size_t, ProtocolFailure>::Ok(read);
}

OutgoingFile MakeOutgoingFile(
    std::string name,
    std::string mime_type,
    std::vector<uint8_t> content) {
    return OutgoingFile{
        std::move(name),
        std::move(mime_type),
        std::make_unique<MemoryByteSource>(std::move(content))};
}

Result<OutgoingFile, ProtocolFailure> OpenOutgoingFile(
    const std::string& path,
    std::string mime_type) {
    auto source = FileByteSource::Open(path);
    PEERDROP_TRY(source);
    return Result<OutgoingFile, ProtocolFailure>::Ok(OutgoingFile{
        std::filesystem::path(path).filename().string(),
        std::move(mime_type),
        std::move(source).Unwrap()});
}

}
