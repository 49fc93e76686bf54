#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <string>
#include <string_view>
namespace peerdrop::protocol::identity {

/// Random 6-character lowercase base-36 id. Not reserved anywhere; two
/// parties may draw the same id.
[[nodiscard]] std::string GeneratePeerId();

/// Trims surrounding whitespace; blank input is InvalidInput.
[[nodiscard]] Result<std::string, ProtocolFailure> NormalizePeerId(std::string_view raw);

}
