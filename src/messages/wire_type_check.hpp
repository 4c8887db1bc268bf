#pragma once
#include "olmwire/core/constants.hpp"
#include "olmwire/core/failures.hpp"
#include "olmwire/core/format.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <google/protobuf/unknown_field_set.h>

#include <optional>
#include <string>

namespace olmwire::protocol::messages {

/**
 * @brief Find a declared field that arrived with the wrong wire type
 *
 * ParseFromArray moves such a field into the unknown-field set and leaves the
 * declared field at its default. Unknown set entries whose number the schema
 * declares are therefore wire type mismatches. Undeclared and reserved numbers
 * stay skipped.
 */
inline std::optional<DecodeError> FindWireTypeMismatch(const google::protobuf::Message& message) {
    const auto* descriptor = message.GetDescriptor();
    const auto& unknown = message.GetReflection()->GetUnknownFields(message);
    for (int i = 0; i < unknown.field_count(); ++i) {
        const int number = unknown.field(i).number();
        if (descriptor->FindFieldByNumber(number) != nullptr) {
            return DecodeError::StructuralDecode(compat::format(
                fmt::runtime(ErrorMessages::INVALID_WIRE_TYPE), number, std::string(descriptor->name())));
        }
    }
    return std::nullopt;
}

} // namespace olmwire::protocol::messages
