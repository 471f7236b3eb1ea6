#include <seqmap/cql/errors.hpp>

#include <seqmap/assert.hpp>

#include <fmt/format.h>

namespace seqmap::cql {

std::string_view to_string(type_check_kind kind) {
    switch (kind) {
    case type_check_kind::mismatched_type:
        return "the C++ type cannot represent values of this column type";
    case type_check_kind::not_map:
        return "the column type is not a map";
    case type_check_kind::not_list_or_set:
        return "the column type is neither a list nor a set";
    case type_check_kind::key_type_check_failed:
        return "the map key type failed to type check";
    case type_check_kind::value_type_check_failed:
        return "the map value type failed to type check";
    case type_check_kind::element_type_check_failed:
        return "the collection element type failed to type check";
    }
    SEQMAP_UNREACHABLE("invalid type check kind");
}

std::string_view to_string(serialization_kind kind) {
    switch (kind) {
    case serialization_kind::too_many_elements:
        return "the collection contains too many elements to fit in CQL representation";
    case serialization_kind::key_serialization_failed:
        return "failed to serialize one of the keys";
    case serialization_kind::value_serialization_failed:
        return "failed to serialize one of the values";
    case serialization_kind::element_serialization_failed:
        return "failed to serialize one of the elements";
    case serialization_kind::size_overflow:
        return "the serialized value is too large to fit in a cell";
    }
    SEQMAP_UNREACHABLE("invalid serialization kind");
}

std::string_view to_string(deserialization_kind kind) {
    switch (kind) {
    case deserialization_kind::expected_non_null:
        return "expected a non-null value";
    case deserialization_kind::truncated:
        return "the frame ended unexpectedly";
    case deserialization_kind::byte_length_mismatch:
        return "the value has the wrong number of bytes";
    case deserialization_kind::negative_element_count:
        return "the collection has a negative element count";
    case deserialization_kind::invalid_ascii:
        return "the value contains non-ascii characters";
    case deserialization_kind::key_deserialization_failed:
        return "failed to deserialize one of the keys";
    case deserialization_kind::value_deserialization_failed:
        return "failed to deserialize one of the values";
    case deserialization_kind::element_deserialization_failed:
        return "failed to deserialize one of the elements";
    }
    SEQMAP_UNREACHABLE("invalid deserialization kind");
}

codec_error::codec_error(const std::string& message, std::string type_name, column_type got)
    : exception(message)
    , m_type_name(std::move(type_name))
    , m_got(std::move(got)) {}

type_check_error::type_check_error(std::string type_name, column_type got, type_check_kind kind)
    : codec_error(fmt::format("Failed to type check C++ type {} against CQL type {}: {}", type_name,
                              got.to_string(), to_string(kind)),
                  type_name, got)
    , m_kind(kind) {}

serialization_error::serialization_error(std::string type_name, column_type got,
                                         serialization_kind kind)
    : codec_error(fmt::format("Failed to serialize C++ type {} into CQL type {}: {}", type_name,
                              got.to_string(), to_string(kind)),
                  type_name, got)
    , m_kind(kind) {}

deserialization_error::deserialization_error(std::string type_name, column_type got,
                                             deserialization_kind kind)
    : codec_error(fmt::format("Failed to deserialize C++ type {} from CQL type {}: {}",
                              type_name, got.to_string(), to_string(kind)),
                  type_name, got)
    , m_kind(kind) {}

} // namespace seqmap::cql
