#ifndef SEQMAP_PROTOCOL_HPP
#define SEQMAP_PROTOCOL_HPP

#include <seqmap/data_shape.hpp>
#include <seqmap/defs.hpp>
#include <seqmap/exception.hpp>
#include <seqmap/logging.hpp>
#include <seqmap/ordered_map.hpp>
#include <seqmap/type_traits.hpp>

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>

namespace seqmap {

/// \defgroup protocol Map Protocol
///
/// Glue between \ref ordered_map and structured-data formats.
///
/// A *map sink* receives a map entry by entry. It must provide:
///
/// \code{.cpp}
///     void begin_map(size_t size);                   // announces the number of entries
///     template<typename K, typename V>
///     void write_entry(const K& key, const V& value);
///     void end_map();
/// \endcode
///
/// A *map source* produces a map entry by entry. Sources may be backed by
/// a fully parsed document or by a streaming parser. They must provide:
///
/// \code{.cpp}
///     data_shape shape() const;                      // data_shape::map for map-shaped input
///     std::optional<size_t> size_hint() const;       // empty if the size is unknown
///     template<typename K, typename V>
///     std::optional<std::pair<K, V>> next_entry();   // empty after the last entry
/// \endcode
///
/// A source may also declare `using error_type = ...;` (derived from \ref seqmap::exception)
/// to select the exception thrown when a key strategy rejects a key. The default is
/// \ref seqmap::decode_error.

namespace detail {

template<typename Source, typename = void>
struct source_error_type {
    using type = decode_error;
};

template<typename Source>
struct source_error_type<Source, void_t<typename Source::error_type>> {
    using type = typename Source::error_type;
};

// Upper bound for reservations based on a source's size hint. Hints may come
// straight from untrusted input (e.g. a declared element count).
constexpr size_t max_reserved_entries = 4096;

} // namespace detail

/// The exception type used to report rejected keys when decoding from `Source`.
///
/// \ingroup protocol
template<typename Source>
using source_error_t = typename detail::source_error_type<remove_cvref_t<Source>>::type;

/// Writes all entries of `map` to the given sink, in insertion order.
/// Keys are passed through the map's key strategy.
///
/// \ingroup protocol
template<typename K, typename V, typename S, typename Sink>
void encode_map(const ordered_map<K, V, S>& map, Sink& sink) {
    using traits = key_strategy_traits<S>;

    sink.begin_map(map.size());
    for (const auto& entry : map) {
        sink.write_entry(traits::project(entry.first), entry.second);
    }
    sink.end_map();
}

/// Reads a map of type `Map` (an instance of \ref ordered_map) from the given source.
///
/// Entries are read one at a time and appended in the order in which the source
/// produces them. The source's size hint is only used to preallocate a bounded
/// amount of storage. Every key is converted by the map's key strategy; decoding stops
/// at the first key that the strategy rejects.
///
/// \throws shape_error             If the source is not map-shaped.
/// \throws source_error_t<Source>  If a key cannot be converted.
///
/// \ingroup protocol
template<typename Map, typename Source>
Map decode_map(Source& source) {
    static_assert(is_ordered_map_v<Map>, "Map must be an instance of seqmap::ordered_map.");

    using traits = key_strategy_traits<typename Map::strategy_type>;
    using wire_key_type = typename Map::wire_key_type;
    using mapped_type = typename Map::mapped_type;
    using error_type = source_error_t<Source>;

    const data_shape shape = source.shape();
    if (shape != data_shape::map) {
        logger()->debug("Rejecting input of shape {} (expected a map)", to_string(shape));
        SEQMAP_THROW(shape_error(data_shape::map, shape));
    }

    Map map;
    if (std::optional<size_t> hint = source.size_hint())
        map.reserve(std::min(*hint, detail::max_reserved_entries));

    while (auto entry = source.template next_entry<wire_key_type, mapped_type>()) {
        map.insert_unchecked(traits::template lift<error_type>(std::move(entry->first)),
                             std::move(entry->second));
    }
    return map;
}

} // namespace seqmap

#endif // SEQMAP_PROTOCOL_HPP
