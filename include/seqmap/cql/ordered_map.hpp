#ifndef SEQMAP_CQL_ORDERED_MAP_HPP
#define SEQMAP_CQL_ORDERED_MAP_HPP

#include <seqmap/cql/value.hpp>
#include <seqmap/logging.hpp>
#include <seqmap/ordered_map.hpp>

#include <algorithm>
#include <optional>

namespace seqmap::cql {

namespace detail {

/**
 * Writes a map cell with `size` entries taken from `[first, last)`.
 *
 * The element count is validated before anything is written to `writer`.
 * If an entry fails to serialize, the partial cell is removed again.
 * `Owner` is the C++ type reported in errors.
 */
template<typename Owner, typename Key, typename Value, typename Iter>
void serialize_mapping(size_t size, Iter first, Iter last, const column_type& type, cell_writer writer) {
    if (!type.is_map() || type.frozen())
        SEQMAP_THROW(type_check_error(type_name<Owner>(), type, type_check_kind::not_map));

    const i32 count = checked_element_count<Owner>(type, size);
    cell_value_builder builder = writer.into_value_builder();
    try {
        builder.append_number(count);
        for (; first != last; ++first) {
            serialize_element<Owner, Key>(first->first, type, type.key_type(), builder.make_sub_writer(),
                                          serialization_kind::key_serialization_failed);
            serialize_element<Owner, Value>(first->second, type, type.value_type(),
                                            builder.make_sub_writer(),
                                            serialization_kind::value_serialization_failed);
        }
    } catch (...) {
        builder.rollback();
        throw;
    }
    finish_collection<Owner>(type, builder);
}

} // namespace detail

/**
 * Stores an ordered_map in a CQL map column.
 *
 * Entries are written in insertion order, duplicates included. Keys are serialized
 * with the codec of the strategy's domain type, i.e. the type actually stored in the map.
 * Reading a map cell appends the entries in the order in which they appear on the wire.
 */
template<typename K, typename V, typename S>
struct value_codec<ordered_map<K, V, S>> {
    using map_type = ordered_map<K, V, S>;
    using key_type = typename map_type::key_type;
    using mapped_type = typename map_type::mapped_type;

    static void type_check(const column_type& type) {
        if (!type.is_map() || type.frozen()) {
            logger()->debug("Column type {} cannot store {}", type.to_string(),
                            detail::type_name<map_type>());
            SEQMAP_THROW(type_check_error(detail::type_name<map_type>(), type, type_check_kind::not_map));
        }

        detail::type_check_element<map_type, key_type>(type, type.key_type(),
                                                      type_check_kind::key_type_check_failed);
        detail::type_check_element<map_type, mapped_type>(type, type.value_type(),
                                                         type_check_kind::value_type_check_failed);
    }

    static void serialize(const map_type& map, const column_type& type, cell_writer writer) {
        detail::serialize_mapping<map_type, key_type, mapped_type>(map.size(), map.begin(), map.end(),
                                                                   type, writer);
    }

    static map_type deserialize(const column_type& type, std::optional<frame_slice> cell) {
        type_check(type);

        frame_slice content = detail::require_non_null<map_type>(type, cell);
        const size_t count = detail::read_element_count<map_type>(type, content);

        map_type map;
        // Every entry occupies at least 8 bytes (two length prefixes).
        map.reserve(std::min(count, content.size() / 8));
        for (size_t i = 0; i < count; ++i) {
            std::optional<frame_slice> key_cell = detail::read_element_cell<map_type>(type, content);
            key_type key = detail::deserialize_element<map_type, key_type>(
                type, type.key_type(), key_cell, deserialization_kind::key_deserialization_failed);

            std::optional<frame_slice> value_cell = detail::read_element_cell<map_type>(type, content);
            mapped_type value = detail::deserialize_element<map_type, mapped_type>(
                type, type.value_type(), value_cell, deserialization_kind::value_deserialization_failed);

            map.insert_unchecked(std::move(key), std::move(value));
        }
        return map;
    }
};

} // namespace seqmap::cql

#endif // SEQMAP_CQL_ORDERED_MAP_HPP
