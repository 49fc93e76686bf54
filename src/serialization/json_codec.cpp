#include "peerdrop/serialization/json_codec.hpp"
#include "peerdrop/core/format.hpp"
#include <google/protobuf/util/json_util.h>
namespace peerdrop::protocol::serialization {

Result<std::string, ProtocolFailure> ToJson(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = false;
    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("Failed to encode {}: {}",
                    message.GetDescriptor()->name(), status.ToString())));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(json));
}

Result<Unit, ProtocolFailure> FromJson(std::string_view json, google::protobuf::Message& message) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    message.Clear();
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &message, options);
    if (!status.ok()) {
        message.Clear();
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Malformed {} JSON: {}",
                    message.GetDescriptor()->name(), status.ToString())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
