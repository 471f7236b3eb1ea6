#ifndef SEQMAP_TYPE_TRAITS_HPP
#define SEQMAP_TYPE_TRAITS_HPP

#include <seqmap/defs.hpp>

#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>

namespace seqmap {

template<typename... T>
using void_t = void;

template<typename T>
struct always_false : std::false_type {};

template<typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

/// True if `T` is a growable sequence, i.e. it names its `value_type`
/// and supports `push_back(value_type&&)` (std::vector, std::deque, ...).
template<typename T, typename = void>
struct is_sequence : std::false_type {};

template<typename T>
struct is_sequence<T, void_t<typename T::value_type,
                             decltype(std::declval<T&>().push_back(
                                 std::declval<typename T::value_type&&>()))>> : std::true_type {};

template<typename T>
constexpr bool is_sequence_v = is_sequence<T>::value;

template<typename T>
using IsSequence = std::enable_if_t<is_sequence_v<T>>;

/// True if `T` is an input iterator (as classified by std::iterator_traits).
template<typename T, typename = void>
struct is_input_iterator : std::false_type {};

template<typename T>
struct is_input_iterator<T, void_t<typename std::iterator_traits<T>::iterator_category>>
    : std::is_convertible<typename std::iterator_traits<T>::iterator_category, std::input_iterator_tag> {};

template<typename T>
constexpr bool is_input_iterator_v = is_input_iterator<T>::value;

template<typename T>
using IsInputIterator = std::enable_if_t<is_input_iterator_v<T>>;

/// True if values of type `T` can be compared using `==`.
template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<
    T, void_t<decltype(static_cast<bool>(std::declval<const T&>() == std::declval<const T&>()))>>
    : std::true_type {};

template<typename T>
constexpr bool is_equality_comparable_v = is_equality_comparable<T>::value;

/// True if `Hash` can hash values of type `T`.
template<typename T, typename Hash = std::hash<T>, typename = void>
struct is_hashable : std::false_type {};

template<typename T, typename Hash>
struct is_hashable<T, Hash, void_t<decltype(std::declval<const Hash&>()(std::declval<const T&>()))>>
    : std::true_type {};

template<typename T, typename Hash = std::hash<T>>
constexpr bool is_hashable_v = is_hashable<T, Hash>::value;

} // namespace seqmap

#endif // SEQMAP_TYPE_TRAITS_HPP
