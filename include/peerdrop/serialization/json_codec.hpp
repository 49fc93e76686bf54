#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <google/protobuf/message.h>
#include <string>
#include <string_view>
namespace peerdrop::protocol::serialization {

/// Protobuf message to compact JSON with camelCase names and zero values printed.
/// Failures are Encode.
[[nodiscard]] Result<std::string, ProtocolFailure> ToJson(const google::protobuf::Message& message);

/// JSON text into `message`, ignoring unknown fields. Failures are InvalidInput
/// carrying the parser's diagnostic.
[[nodiscard]] Result<Unit, ProtocolFailure> FromJson(std::string_view json, google::protobuf::Message& message);

}
