#ifndef SEQMAP_TYPESENSE_HPP
#define SEQMAP_TYPESENSE_HPP

#include <seqmap/defs.hpp>
#include <seqmap/ordered_map.hpp>
#include <seqmap/type_traits.hpp>

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seqmap::typesense {

/**
 * Declares the typesense field type used to index values of type `T`.
 *
 * Specializations provide `static std::string name()`. Types without a
 * specialization cannot be used as fields (compile time error).
 */
template<typename T, typename Enable = void>
struct field_type {
    static_assert(always_false<T>::value, "The type has no typesense field type.");
};

template<>
struct field_type<i32> {
    static std::string name() { return "int32"; }
};

template<>
struct field_type<i64> {
    static std::string name() { return "int64"; }
};

template<>
struct field_type<float> {
    static std::string name() { return "float"; }
};

template<>
struct field_type<double> {
    static std::string name() { return "float"; }
};

template<>
struct field_type<bool> {
    static std::string name() { return "bool"; }
};

template<>
struct field_type<std::string> {
    static std::string name() { return "string"; }
};

// Optional fields have the type of their content.
template<typename T>
struct field_type<std::optional<T>> {
    static std::string name() { return field_type<T>::name(); }
};

template<typename T, typename Alloc>
struct field_type<std::vector<T, Alloc>> {
    static std::string name() { return field_type<T>::name() + "[]"; }
};

// Maps are indexed as nested objects, whatever their key and value types are.
template<typename K, typename V, typename S>
struct field_type<ordered_map<K, V, S>> {
    static std::string name() { return "object"; }
};

template<typename K, typename V, typename Compare, typename Alloc>
struct field_type<std::map<K, V, Compare, Alloc>> {
    static std::string name() { return "object"; }
};

template<typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct field_type<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    static std::string name() { return "object"; }
};

namespace detail {

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

/// Returns the typesense type name for values of type `T`, e.g. "int64" or "object".
template<typename T>
std::string to_typesense_type() {
    return field_type<remove_cvref_t<T>>::name();
}

/// A field in a typesense collection schema.
struct field {
    std::string name;
    std::string type;
    bool optional = false;
};

inline bool operator==(const field& lhs, const field& rhs) {
    return lhs.name == rhs.name && lhs.type == rhs.type && lhs.optional == rhs.optional;
}

inline bool operator!=(const field& lhs, const field& rhs) {
    return !(lhs == rhs);
}

/// Returns the schema field for a member of type `T` with the given name.
/// Fields of type `std::optional<U>` are marked as optional.
template<typename T>
field make_field(std::string name) {
    using type = remove_cvref_t<T>;
    return field{std::move(name), to_typesense_type<type>(), detail::is_optional<type>::value};
}

} // namespace seqmap::typesense

#endif // SEQMAP_TYPESENSE_HPP
