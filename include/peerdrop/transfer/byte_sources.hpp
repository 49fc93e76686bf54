#pragma once
#include "peerdrop/interfaces/i_byte_source.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
namespace peerdrop::protocol::transfer {

class MemoryByteSource final : public interfaces::IByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> content)
        : content_(std::move(content)) {}

    [[nodiscard]] uint64_t Size() const override { return content_.size(); }
    Result<size_t, ProtocolFailure> ReadAt(uint64_t offset, std::span<uint8_t> out) override;

private:
    std::vector<uint8_t> content_;
};

class FileByteSource final : public interfaces::IByteSource {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileByteSource>, ProtocolFailure> Open(const std::string& path);

    [[nodiscard]] uint64_t Size() const override { return size_; }
    Result<size_t, ProtocolFailure> ReadAt(uint64_t offset, std::span<uint8_t> out) override;

private:
    FileByteSource(std::ifstream stream, uint64_t size)
        : stream_(std::move(stream)), size_(size) {}

    std::ifstream stream_;
    uint64_t size_;
};

/// A file offered for sending.
struct OutgoingFile {
    std::string name;
    std::string mime_type;
    std::unique_ptr<interfaces::IByteSource> source;
};

[[nodiscard]] OutgoingFile MakeOutgoingFile(
    std::string name,
    std::string mime_type,
    std::vector<uint8_t> content);

/// Opens `path` and names it after its final path component.
[[nodiscard]] Result<OutgoingFile, ProtocolFailure> OpenOutgoingFile(
    const std::string& path,
    std::string mime_type);

}
