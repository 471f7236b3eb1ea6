#ifndef SEQMAP_CQL_VALUE_HPP
#define SEQMAP_CQL_VALUE_HPP

#include <seqmap/cql/column_type.hpp>
#include <seqmap/cql/errors.hpp>
#include <seqmap/cql/frame_slice.hpp>
#include <seqmap/cql/writers.hpp>
#include <seqmap/defs.hpp>
#include <seqmap/exception.hpp>
#include <seqmap/type_traits.hpp>

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>

namespace seqmap::cql {

/// \defgroup cql_values CQL Value Codecs
///
/// Conversion between C++ values and the binary representation of CQL column values.
///
/// Every supported type `T` has a `value_codec<T>` specialization with the following members:
///
/// \code{.cpp}
///     // Throws type_check_error if T is incompatible with `type`.
///     static void type_check(const column_type& type);
///
///     // Writes `value` as exactly one cell. Throws type_check_error or serialization_error.
///     static void serialize(const T& value, const column_type& type, cell_writer writer);
///
///     // Reads a value from a cell (empty if the cell is null). Throws type_check_error
///     // or deserialization_error.
///     static T deserialize(const column_type& type, std::optional<frame_slice> cell);
/// \endcode
///
/// Supported out of the box: bool, i8, i16, i32, i64, float, double, std::string,
/// std::optional<T>, std::vector<T> (lists and sets) and seqmap::ordered_map (maps,
/// see <seqmap/cql/ordered_map.hpp>).

template<typename T, typename Enable = void>
struct value_codec {
    static_assert(always_false<T>::value, "The type has no CQL value codec.");
};

namespace detail {

// Human readable name of T for error messages.
template<typename T>
std::string type_name() {
    return boost::core::demangle(typeid(T).name());
}

template<typename T>
void check_native(const column_type& type, std::initializer_list<native_type> accepted) {
    if (type.is_native() && std::find(accepted.begin(), accepted.end(), type.native()) != accepted.end())
        return;
    SEQMAP_THROW(type_check_error(type_name<T>(), type, type_check_kind::mismatched_type));
}

template<typename T>
const frame_slice& require_non_null(const column_type& type, const std::optional<frame_slice>& cell) {
    if (!cell)
        SEQMAP_THROW(deserialization_error(type_name<T>(), type, deserialization_kind::expected_non_null));
    return *cell;
}

// Reads the element count of a collection.
template<typename T>
size_t read_element_count(const column_type& type, frame_slice& content) {
    i32 count = 0;
    try {
        count = content.read_number<i32>();
    } catch (const frame_error&) {
        SEQMAP_THROW_NESTED(deserialization_error(type_name<T>(), type, deserialization_kind::truncated));
    }
    if (count < 0)
        SEQMAP_THROW(deserialization_error(type_name<T>(), type, deserialization_kind::negative_element_count));
    return static_cast<size_t>(count);
}

// Reads the next nested cell of a collection.
template<typename T>
std::optional<frame_slice> read_element_cell(const column_type& type, frame_slice& content) {
    try {
        return content.read_cell();
    } catch (const frame_error&) {
        SEQMAP_THROW_NESTED(deserialization_error(type_name<T>(), type, deserialization_kind::truncated));
    }
}

// Runs the type check of an element type and reports failures in the context of the collection `Owner`.
template<typename Owner, typename Element>
void type_check_element(const column_type& owner_type, const column_type& element_type,
                        type_check_kind kind) {
    try {
        value_codec<Element>::type_check(element_type);
    } catch (const exception&) {
        SEQMAP_THROW_NESTED(type_check_error(type_name<Owner>(), owner_type, kind));
    }
}

// Serializes an element into its own cell and reports failures in the context of the collection `Owner`.
template<typename Owner, typename Element>
void serialize_element(const Element& value, const column_type& owner_type,
                       const column_type& element_type, cell_writer writer, serialization_kind kind) {
    try {
        value_codec<Element>::serialize(value, element_type, writer);
    } catch (const exception&) {
        SEQMAP_THROW_NESTED(serialization_error(type_name<Owner>(), owner_type, kind));
    }
}

// Deserializes an element from its cell and reports failures in the context of the collection `Owner`.
template<typename Owner, typename Element>
Element deserialize_element(const column_type& owner_type, const column_type& element_type,
                            std::optional<frame_slice> cell, deserialization_kind kind) {
    try {
        return value_codec<Element>::deserialize(element_type, cell);
    } catch (const exception&) {
        SEQMAP_THROW_NESTED(deserialization_error(type_name<Owner>(), owner_type, kind));
    }
}

// Completes a collection cell. The cell is rolled back if it is too large.
template<typename Owner>
void finish_collection(const column_type& type, cell_value_builder& builder) {
    try {
        builder.finish();
    } catch (const cell_overflow_error&) {
        SEQMAP_THROW_NESTED(serialization_error(type_name<Owner>(), type, serialization_kind::size_overflow));
    }
}

// Writes the element count of a collection. Called before any bytes are written,
// so an oversized collection leaves the output untouched.
template<typename Owner>
i32 checked_element_count(const column_type& type, size_t count) {
    if (count > static_cast<size_t>(std::numeric_limits<i32>::max()))
        SEQMAP_THROW(serialization_error(type_name<Owner>(), type, serialization_kind::too_many_elements));
    return static_cast<i32>(count);
}

// Fixed size numbers in big endian format.
template<typename T, native_type Type>
struct number_codec {
    static void type_check(const column_type& type) { check_native<T>(type, {Type}); }

    static void serialize(const T& value, const column_type& type, cell_writer writer) {
        type_check(type);

        byte buffer[sizeof(T)];
        store_big_endian(value, buffer);
        writer.set_value(buffer, sizeof(T));
    }

    static T deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);

        const frame_slice& bytes = require_non_null<T>(type, cell);
        if (bytes.size() != sizeof(T))
            SEQMAP_THROW(deserialization_error(type_name<T>(), type, deserialization_kind::byte_length_mismatch));
        return load_big_endian<T>(bytes.data());
    }
};

} // namespace detail

template<>
struct value_codec<i8> : detail::number_codec<i8, native_type::tinyint> {};
template<>
struct value_codec<i16> : detail::number_codec<i16, native_type::smallint> {};
template<>
struct value_codec<i32> : detail::number_codec<i32, native_type::int_> {};
template<>
struct value_codec<i64> : detail::number_codec<i64, native_type::bigint> {};
template<>
struct value_codec<float> : detail::number_codec<float, native_type::float_> {};
template<>
struct value_codec<double> : detail::number_codec<double, native_type::double_> {};

template<>
struct value_codec<bool> {
    static void type_check(const column_type& type) {
        detail::check_native<bool>(type, {native_type::boolean});
    }

    static void serialize(bool value, const column_type& type, cell_writer writer) {
        type_check(type);

        const byte b = value ? 1 : 0;
        writer.set_value(&b, 1);
    }

    static bool deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);

        const frame_slice& bytes = detail::require_non_null<bool>(type, cell);
        if (bytes.size() != 1)
            SEQMAP_THROW(deserialization_error(detail::type_name<bool>(), type,
                                               deserialization_kind::byte_length_mismatch));
        return bytes.data()[0] != 0;
    }
};

// Strings can be stored in text and ascii columns. Ascii values are validated when read.
template<>
struct value_codec<std::string> {
    static void type_check(const column_type& type) {
        detail::check_native<std::string>(type, {native_type::text, native_type::ascii});
    }

    static void serialize(const std::string& value, const column_type& type, cell_writer writer) {
        type_check(type);

        try {
            writer.set_value(reinterpret_cast<const byte*>(value.data()), value.size());
        } catch (const cell_overflow_error&) {
            SEQMAP_THROW_NESTED(serialization_error(detail::type_name<std::string>(), type,
                                                    serialization_kind::size_overflow));
        }
    }

    static std::string deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);

        const frame_slice& bytes = detail::require_non_null<std::string>(type, cell);
        std::string value(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (type.native() == native_type::ascii) {
            const bool is_ascii = std::all_of(value.begin(), value.end(), [](char c) {
                return static_cast<unsigned char>(c) < 0x80;
            });
            if (!is_ascii)
                SEQMAP_THROW(deserialization_error(detail::type_name<std::string>(), type,
                                                   deserialization_kind::invalid_ascii));
        }
        return value;
    }
};

// Optionals map to nullable cells.
template<typename T>
struct value_codec<std::optional<T>> {
    static void type_check(const column_type& type) { value_codec<T>::type_check(type); }

    static void serialize(const std::optional<T>& value, const column_type& type, cell_writer writer) {
        if (value) {
            value_codec<T>::serialize(*value, type, writer);
        } else {
            type_check(type);
            writer.set_null();
        }
    }

    static std::optional<T> deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);
        if (!cell)
            return std::nullopt;
        return value_codec<T>::deserialize(type, cell);
    }
};

// Vectors are stored as lists or sets: an element count followed by one cell per element.
template<typename T, typename Alloc>
struct value_codec<std::vector<T, Alloc>> {
    using vector_type = std::vector<T, Alloc>;

    static void check_shape(const column_type& type) {
        if (type.is_collection() && type.collection() != collection_type::map)
            return;
        SEQMAP_THROW(type_check_error(detail::type_name<vector_type>(), type,
                                      type_check_kind::not_list_or_set));
    }

    static void type_check(const column_type& type) {
        check_shape(type);
        detail::type_check_element<vector_type, T>(type, type.element_type(),
                                                   type_check_kind::element_type_check_failed);
    }

    static void serialize(const vector_type& value, const column_type& type, cell_writer writer) {
        check_shape(type);

        const i32 count = detail::checked_element_count<vector_type>(type, value.size());
        cell_value_builder builder = writer.into_value_builder();
        try {
            builder.append_number(count);
            for (const T& element : value) {
                detail::serialize_element<vector_type>(element, type, type.element_type(),
                                                       builder.make_sub_writer(),
                                                       serialization_kind::element_serialization_failed);
            }
        } catch (...) {
            builder.rollback();
            throw;
        }
        detail::finish_collection<vector_type>(type, builder);
    }

    static vector_type deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);

        frame_slice content = detail::require_non_null<vector_type>(type, cell);
        const size_t count = detail::read_element_count<vector_type>(type, content);

        vector_type result;
        // Every element occupies at least 4 bytes, don't trust the count blindly.
        result.reserve(std::min(count, content.size() / 4));
        for (size_t i = 0; i < count; ++i) {
            std::optional<frame_slice> element_cell = detail::read_element_cell<vector_type>(type, content);
            result.push_back(detail::deserialize_element<vector_type, T>(
                type, type.element_type(), element_cell,
                deserialization_kind::element_deserialization_failed));
        }
        return result;
    }
};

/// Returns normally if `T` can be serialized to and deserialized from columns of the given type.
///
/// \throws type_check_error If the types are incompatible.
///
/// \ingroup cql_values
template<typename T>
void type_check(const column_type& type) {
    value_codec<T>::type_check(type);
}

/// Serializes `value` as a single cell (length prefix included) of the given column type.
/// The value is type checked before anything is written.
///
/// \throws type_check_error      If `T` is incompatible with `type`.
/// \throws serialization_error   If the value cannot be represented.
///
/// \ingroup cql_values
template<typename T>
std::vector<byte> serialize_value(const T& value, const column_type& type,
                                  size_t size_limit = max_cell_size) {
    value_codec<T>::type_check(type);

    std::vector<byte> buffer;
    value_codec<T>::serialize(value, type, cell_writer(buffer, size_limit));
    return buffer;
}

/// Deserializes a value from the next cell in `frame`.
/// The value is type checked before anything is read.
///
/// \throws type_check_error        If `T` is incompatible with `type`.
/// \throws deserialization_error   If the cell is malformed.
///
/// \ingroup cql_values
template<typename T>
T deserialize_value(const column_type& type, frame_slice frame) {
    value_codec<T>::type_check(type);

    std::optional<frame_slice> cell;
    try {
        cell = frame.read_cell();
    } catch (const frame_error&) {
        SEQMAP_THROW_NESTED(deserialization_error(detail::type_name<T>(), type, deserialization_kind::truncated));
    }
    return value_codec<T>::deserialize(type, cell);
}

} // namespace seqmap::cql

#endif // SEQMAP_CQL_VALUE_HPP
