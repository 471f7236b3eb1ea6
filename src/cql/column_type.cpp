#include <seqmap/cql/column_type.hpp>

#include <seqmap/assert.hpp>

#include <fmt/format.h>

namespace seqmap::cql {

std::string_view to_string(native_type type) {
    switch (type) {
    case native_type::boolean:
        return "boolean";
    case native_type::tinyint:
        return "tinyint";
    case native_type::smallint:
        return "smallint";
    case native_type::int_:
        return "int";
    case native_type::bigint:
        return "bigint";
    case native_type::float_:
        return "float";
    case native_type::double_:
        return "double";
    case native_type::ascii:
        return "ascii";
    case native_type::text:
        return "text";
    }
    SEQMAP_UNREACHABLE("invalid native type");
}

std::string_view to_string(collection_type type) {
    switch (type) {
    case collection_type::list:
        return "list";
    case collection_type::set:
        return "set";
    case collection_type::map:
        return "map";
    }
    SEQMAP_UNREACHABLE("invalid collection type");
}

column_type::column_type(collection_type collection, std::vector<column_type> elements, bool frozen)
    : m_is_native(false)
    , m_collection(collection)
    , m_frozen(frozen)
    , m_elements(std::move(elements)) {}

column_type column_type::list(column_type element, bool frozen) {
    return column_type(collection_type::list, {std::move(element)}, frozen);
}

column_type column_type::set(column_type element, bool frozen) {
    return column_type(collection_type::set, {std::move(element)}, frozen);
}

column_type column_type::map(column_type key, column_type value, bool frozen) {
    return column_type(collection_type::map, {std::move(key), std::move(value)}, frozen);
}

native_type column_type::native() const {
    SEQMAP_ASSERT(is_native(), "Not a native type.");
    return m_native;
}

collection_type column_type::collection() const {
    SEQMAP_ASSERT(is_collection(), "Not a collection type.");
    return m_collection;
}

const column_type& column_type::element_type() const {
    SEQMAP_ASSERT(is_collection() && m_collection != collection_type::map,
                  "Not a list or set type.");
    return m_elements[0];
}

const column_type& column_type::key_type() const {
    SEQMAP_ASSERT(is_map(), "Not a map type.");
    return m_elements[0];
}

const column_type& column_type::value_type() const {
    SEQMAP_ASSERT(is_map(), "Not a map type.");
    return m_elements[1];
}

std::string column_type::to_string() const {
    if (is_native())
        return std::string(cql::to_string(m_native));

    std::string inner;
    if (m_collection == collection_type::map) {
        inner = fmt::format("map<{}, {}>", key_type().to_string(), value_type().to_string());
    } else {
        inner = fmt::format("{}<{}>", cql::to_string(m_collection), element_type().to_string());
    }
    return m_frozen ? fmt::format("frozen<{}>", inner) : inner;
}

bool operator==(const column_type& lhs, const column_type& rhs) {
    if (lhs.m_is_native != rhs.m_is_native)
        return false;
    if (lhs.m_is_native)
        return lhs.m_native == rhs.m_native;
    return lhs.m_collection == rhs.m_collection && lhs.m_frozen == rhs.m_frozen
           && lhs.m_elements == rhs.m_elements;
}

} // namespace seqmap::cql
