#ifndef SEQMAP_CQL_ERRORS_HPP
#define SEQMAP_CQL_ERRORS_HPP

#include <seqmap/cql/column_type.hpp>
#include <seqmap/exception.hpp>

#include <string>
#include <string_view>

namespace seqmap::cql {

/// Reasons for a failed type check.
enum class type_check_kind {
    /// The C++ type cannot represent values of the column type.
    mismatched_type,

    /// The column type is not an (unfrozen) map.
    not_map,

    /// The column type is not a list or set.
    not_list_or_set,

    /// The key type of a map did not pass its type check (see nested exception).
    key_type_check_failed,

    /// The value type of a map did not pass its type check (see nested exception).
    value_type_check_failed,

    /// The element type of a list or set did not pass its type check (see nested exception).
    element_type_check_failed,
};

std::string_view to_string(type_check_kind kind);

/// Reasons for a failed serialization.
enum class serialization_kind {
    /// The collection has more elements than can be represented by a signed 32-bit count.
    too_many_elements,

    /// Serialization of a map key failed (see nested exception).
    key_serialization_failed,

    /// Serialization of a map value failed (see nested exception).
    value_serialization_failed,

    /// Serialization of a list or set element failed (see nested exception).
    element_serialization_failed,

    /// The serialized value exceeds the maximum cell size.
    size_overflow,
};

std::string_view to_string(serialization_kind kind);

/// Reasons for a failed deserialization.
enum class deserialization_kind {
    /// A null cell was encountered for a type that cannot represent null.
    expected_non_null,

    /// The frame ended before the value was complete.
    truncated,

    /// The cell has the wrong length for a fixed size type.
    byte_length_mismatch,

    /// A collection announced a negative number of elements.
    negative_element_count,

    /// An ascii column contained a non-ascii character.
    invalid_ascii,

    /// Deserialization of a map key failed (see nested exception).
    key_deserialization_failed,

    /// Deserialization of a map value failed (see nested exception).
    value_deserialization_failed,

    /// Deserialization of a list or set element failed (see nested exception).
    element_deserialization_failed,
};

std::string_view to_string(deserialization_kind kind);

/**
 * Common base class for errors that concern the conversion between a C++ type
 * and a CQL column type. Carries the name of the C++ type and the column type.
 */
class codec_error : public exception {
public:
    const std::string& type_name() const { return m_type_name; }
    const column_type& got() const { return m_got; }

protected:
    codec_error(const std::string& message, std::string type_name, column_type got);

private:
    std::string m_type_name;
    column_type m_got;
};

/**
 * Thrown when a C++ type is incompatible with the column type it is
 * being serialized to or deserialized from.
 */
class type_check_error : public codec_error {
public:
    type_check_error(std::string type_name, column_type got, type_check_kind kind);

    type_check_kind kind() const { return m_kind; }

private:
    type_check_kind m_kind;
};

/**
 * Thrown when a value could not be serialized.
 */
class serialization_error : public codec_error {
public:
    serialization_error(std::string type_name, column_type got, serialization_kind kind);

    serialization_kind kind() const { return m_kind; }

private:
    serialization_kind m_kind;
};

/**
 * Thrown when a value could not be deserialized.
 */
class deserialization_error : public codec_error {
public:
    deserialization_error(std::string type_name, column_type got, deserialization_kind kind);

    deserialization_kind kind() const { return m_kind; }

private:
    deserialization_kind m_kind;
};

/**
 * Thrown by the cell writers when a cell exceeds its size limit.
 */
class cell_overflow_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when reading past the end of a frame.
 */
class frame_error : public exception {
public:
    using exception::exception;
};

} // namespace seqmap::cql

#endif // SEQMAP_CQL_ERRORS_HPP
