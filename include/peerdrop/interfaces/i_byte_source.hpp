#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
namespace peerdrop::protocol::interfaces {

/// Random-access readable file content of fixed size.
class IByteSource {
public:
    virtual ~IByteSource() = default;
    [[nodiscard]] virtual uint64_t Size() const = 0;
    /// Fills up to out.size() bytes from `offset`; returns the count read.
    virtual Result<size_t, ProtocolFailure> ReadAt(uint64_t offset, std::span<uint8_t> out) = 0;
};
}
