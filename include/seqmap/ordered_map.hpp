#ifndef SEQMAP_ORDERED_MAP_HPP
#define SEQMAP_ORDERED_MAP_HPP

#include <seqmap/assert.hpp>
#include <seqmap/defs.hpp>
#include <seqmap/key_strategy.hpp>
#include <seqmap/type_traits.hpp>

#include <functional>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seqmap {

/**
 * An associative container that remembers the order in which its entries were inserted.
 *
 * The map is a plain sequence of `(key, value)` pairs. Keys are not unique: inserting
 * an existing key appends a second entry and both entries survive iteration and
 * serialization in their original order. There is no lookup by key; use
 * `into_hash_map()` if you need one after the map has been built.
 *
 * `Key` is the key type as seen by serializers ("wire" type). The `Strategy` converts
 * it into the type actually stored in the map (`key_type`, the strategy's domain type)
 * during deserialization and back during serialization. The default strategy stores
 * keys unchanged.
 *
 * \code{.cpp}
 *      // Keys are strings on the wire but stored as integers.
 *      ordered_map<std::string, std::string, decimal_strategy<i64>> map;
 *      map.insert_unchecked(2, "two");
 *      map.insert_unchecked(1, "one");
 *      map.insert_unchecked(2, "deux");  // duplicate keys are kept
 * \endcode
 */
template<typename Key, typename Value, typename Strategy = identity_strategy<Key>>
class ordered_map {
    using traits = key_strategy_traits<Strategy>;

    static_assert(std::is_same_v<Key, typename traits::wire_type>,
                  "The key type must be the wire type of the key strategy.");

public:
    using strategy_type = Strategy;
    using wire_key_type = Key;
    using key_type = typename traits::domain_type;
    using mapped_type = Value;
    using value_type = std::pair<key_type, mapped_type>;
    using container_type = std::vector<value_type>;
    using size_type = typename container_type::size_type;
    using iterator = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

public:
    /// Constructs an empty map.
    ordered_map() = default;

    /// Constructs a map that contains the given entries, in order.
    explicit ordered_map(container_type entries)
        : m_entries(std::move(entries)) {}

    /// Constructs a map from a range of `(key, value)` pairs, in order.
    template<typename InputIt, IsInputIterator<InputIt>* = nullptr>
    ordered_map(InputIt first, InputIt last)
        : m_entries(first, last) {}

    ordered_map(std::initializer_list<value_type> entries)
        : m_entries(entries) {}

    /**
     * Takes ownership of the entries of an unordered map.
     * The resulting order is the iteration order of `map` and must not be relied upon.
     */
    template<typename Hash, typename KeyEqual, typename Alloc>
    explicit ordered_map(std::unordered_map<key_type, mapped_type, Hash, KeyEqual, Alloc> map) {
        m_entries.reserve(map.size());
        while (!map.empty()) {
            auto node = map.extract(map.begin());
            m_entries.emplace_back(std::move(node.key()), std::move(node.mapped()));
        }
    }

    /// Constructs an empty map with room for at least `capacity` entries.
    static ordered_map with_capacity(size_type capacity) {
        ordered_map map;
        map.reserve(capacity);
        return map;
    }

public:
    /// Returns true if the map contains no entries.
    bool empty() const noexcept { return m_entries.empty(); }

    /// Returns the number of entries, including entries with duplicate keys.
    size_type size() const noexcept { return m_entries.size(); }

    size_type capacity() const noexcept { return m_entries.capacity(); }

    /// Reserves storage for at least `capacity` entries. This is only a performance hint.
    void reserve(size_type capacity) { m_entries.reserve(capacity); }

    /**
     * Appends a new entry at the end of the map.
     *
     * The key is not compared against existing keys, so this can
     * create entries with duplicate keys.
     */
    void insert_unchecked(key_type key, mapped_type value) {
        m_entries.emplace_back(std::move(key), std::move(value));
    }

    /**
     * Inserts `value` into a map whose values are sequences, grouping
     * consecutive values with the same key.
     *
     * If the last entry of the map has a key equal to `key`, `value` is appended
     * to that entry's sequence. Otherwise a new entry `(key, {value})` is appended.
     * Only the last entry is considered: equal keys separated by a different key
     * end up in separate entries.
     */
    template<typename V = mapped_type, IsSequence<V>* = nullptr>
    void merge_append(key_type key, typename V::value_type value) {
        static_assert(is_equality_comparable_v<key_type>,
                      "merge_append() requires keys that support operator==.");

        if (!m_entries.empty()) {
            value_type& last = m_entries.back();
            if (last.first == key) {
                last.second.push_back(std::move(value));
                return;
            }
        }

        mapped_type group;
        group.push_back(std::move(value));
        m_entries.emplace_back(std::move(key), std::move(group));
    }

    /// Returns the first entry. The map must not be empty.
    value_type& front() {
        SEQMAP_ASSERT(!empty(), "The map is empty.");
        return m_entries.front();
    }

    const value_type& front() const {
        SEQMAP_ASSERT(!empty(), "The map is empty.");
        return m_entries.front();
    }

    /// Returns the most recently inserted entry. The map must not be empty.
    value_type& back() {
        SEQMAP_ASSERT(!empty(), "The map is empty.");
        return m_entries.back();
    }

    const value_type& back() const {
        SEQMAP_ASSERT(!empty(), "The map is empty.");
        return m_entries.back();
    }

    iterator begin() noexcept { return m_entries.begin(); }
    iterator end() noexcept { return m_entries.end(); }

    const_iterator begin() const noexcept { return m_entries.begin(); }
    const_iterator end() const noexcept { return m_entries.end(); }

    const_iterator cbegin() const noexcept { return m_entries.cbegin(); }
    const_iterator cend() const noexcept { return m_entries.cend(); }

    /// Returns the entries of this map in insertion order.
    container_type& entries() & noexcept { return m_entries; }
    const container_type& entries() const& noexcept { return m_entries; }

    /// Moves the entries out of this map.
    container_type into_entries() && { return std::move(m_entries); }

    /**
     * Moves all entries into a hash map.
     *
     * Insertion order is lost. If a key occurs more than once,
     * the value of its last occurrence wins.
     */
    template<typename Hash = std::hash<key_type>, typename KeyEqual = std::equal_to<key_type>>
    std::unordered_map<key_type, mapped_type, Hash, KeyEqual> into_hash_map() && {
        static_assert(is_hashable_v<key_type, Hash>,
                      "Conversion into a hash map requires a hashable key type.");

        std::unordered_map<key_type, mapped_type, Hash, KeyEqual> result;
        result.reserve(m_entries.size());
        for (value_type& entry : m_entries) {
            result.insert_or_assign(std::move(entry.first), std::move(entry.second));
        }
        m_entries.clear();
        return result;
    }

    /// Two maps are equal if they contain equal entries in the same order.
    friend bool operator==(const ordered_map& lhs, const ordered_map& rhs) {
        return lhs.m_entries == rhs.m_entries;
    }

    friend bool operator!=(const ordered_map& lhs, const ordered_map& rhs) {
        return !(lhs == rhs);
    }

private:
    container_type m_entries;
};

namespace detail {

template<typename T>
struct is_ordered_map : std::false_type {};

template<typename K, typename V, typename S>
struct is_ordered_map<ordered_map<K, V, S>> : std::true_type {};

} // namespace detail

/// True if `T` is an instance of \ref ordered_map.
template<typename T>
constexpr bool is_ordered_map_v = detail::is_ordered_map<remove_cvref_t<T>>::value;

} // namespace seqmap

#endif // SEQMAP_ORDERED_MAP_HPP
