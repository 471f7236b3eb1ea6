#ifndef SEQMAP_CQL_COLUMN_TYPE_HPP
#define SEQMAP_CQL_COLUMN_TYPE_HPP

#include <seqmap/defs.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace seqmap::cql {

/// Native (non-collection) CQL types supported by the value codecs.
enum class native_type {
    boolean,
    tinyint,
    smallint,
    int_,
    bigint,
    float_,
    double_,
    ascii,
    text,
};

/// Returns the CQL name of the type, e.g. "bigint".
std::string_view to_string(native_type type);

enum class collection_type {
    list,
    set,
    map,
};

/// Returns the CQL name of the collection, e.g. "map".
std::string_view to_string(collection_type type);

/**
 * Describes the type of a CQL column (or of an element within a collection column),
 * as announced by the server in result metadata or prepared statement metadata.
 *
 * A column type is either a native type or a collection of other column types.
 * Collections can be frozen, in which case they are treated as a single opaque
 * value by the database.
 */
class column_type {
public:
    /// Constructs a native type.
    column_type(native_type type)
        : m_is_native(true)
        , m_native(type) {}

    static column_type list(column_type element, bool frozen = false);
    static column_type set(column_type element, bool frozen = false);
    static column_type map(column_type key, column_type value, bool frozen = false);

public:
    bool is_native() const { return m_is_native; }
    bool is_collection() const { return !m_is_native; }

    /// True if this is a map collection (frozen or not).
    bool is_map() const { return is_collection() && m_collection == collection_type::map; }

    /// Returns the native type. Must only be called for native types.
    native_type native() const;

    /// Returns the kind of collection. Must only be called for collections.
    collection_type collection() const;

    /// True if this is a frozen collection. Always false for native types.
    bool frozen() const { return m_frozen; }

    /// Returns the element type of a list or set.
    const column_type& element_type() const;

    /// Returns the key type of a map.
    const column_type& key_type() const;

    /// Returns the value type of a map.
    const column_type& value_type() const;

    /// Returns the CQL representation of this type, e.g. `frozen<map<int, text>>`.
    std::string to_string() const;

    friend bool operator==(const column_type& lhs, const column_type& rhs);
    friend bool operator!=(const column_type& lhs, const column_type& rhs) { return !(lhs == rhs); }

private:
    column_type(collection_type collection, std::vector<column_type> elements, bool frozen);

private:
    bool m_is_native = true;
    native_type m_native = native_type::boolean;
    collection_type m_collection = collection_type::list;
    bool m_frozen = false;
    std::vector<column_type> m_elements;
};

} // namespace seqmap::cql

#endif // SEQMAP_CQL_COLUMN_TYPE_HPP
