#ifndef SEQMAP_KEY_STRATEGY_HPP
#define SEQMAP_KEY_STRATEGY_HPP

#include <seqmap/defs.hpp>
#include <seqmap/exception.hpp>
#include <seqmap/type_traits.hpp>

#include <fmt/format.h>

#include <charconv>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace seqmap {

/// \defgroup key_strategy Key Strategies
///
/// A key strategy describes how the keys of an \ref ordered_map are converted
/// between their external ("wire") representation, as seen by a serialization
/// source or sink, and the internal ("domain") representation stored in memory.
///
/// Key strategies are plain class types without state. They are selected at
/// compile time as a template parameter of the container and must provide the
/// following members:
///
/// \code{.cpp}
///     struct my_strategy {
///         // The key type seen by serializers.
///         using wire_type = std::string;
///
///         // The key type stored in the container.
///         using domain_type = i64;
///
///         // Formats an in-memory key for serialization. Must not fail.
///         // May return a reference to `key` or a new value that the
///         // serializer knows how to write.
///         static std::string project(const i64& key);
///
///         // Converts a key read during deserialization. Must throw an
///         // exception of type `Error` (constructed from a message) if the
///         // key is malformed. `Error` is selected by the deserializer.
///         template<typename Error>
///         static i64 lift(std::string wire);
///     };
/// \endcode
///
/// `project` and `lift` do not have to be exact inverses of each other.
/// Errors thrown by `lift` should use \ref SEQMAP_THROW, the error type is
/// always derived from \ref seqmap::exception.

/// The default key strategy: keys are stored exactly as they
/// appear on the wire.
///
/// \ingroup key_strategy
template<typename Wire>
struct identity_strategy {
    using wire_type = Wire;
    using domain_type = Wire;

    static const domain_type& project(const domain_type& key) noexcept { return key; }

    template<typename Error>
    static domain_type lift(wire_type wire) {
        return wire;
    }
};

/// Stores integer keys that are represented as decimal strings on the wire.
/// This is useful for formats where map keys must be strings (e.g. JSON objects)
/// but the application works with numbers.
///
/// Parsing accepts an optional leading '+' or '-' followed by at least one digit,
/// and nothing else.
///
/// \ingroup key_strategy
template<typename Integer>
struct decimal_strategy {
    static_assert(std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>,
                  "The domain type of a decimal strategy must be an integer type.");

    using wire_type = std::string;
    using domain_type = Integer;

    static std::string project(const domain_type& key) { return fmt::format_int(key).str(); }

    template<typename Error>
    static domain_type lift(wire_type wire) {
        const char* first = wire.data();
        const char* last = first + wire.size();
        bool explicit_plus = false;
        if (first != last && *first == '+') {
            explicit_plus = true;
            ++first;
        }

        if (first == last)
            SEQMAP_THROW(Error(fmt::format("cannot parse integer from string \"{}\"", wire)));
        if (explicit_plus && *first == '-')
            SEQMAP_THROW(Error(fmt::format("invalid digit found in string \"{}\"", wire)));

        domain_type result = 0;
        auto [ptr, ec] = std::from_chars(first, last, result);
        if (ec == std::errc::result_out_of_range)
            SEQMAP_THROW(Error(fmt::format("number too large to fit in target type: \"{}\"", wire)));
        if (ec != std::errc() || ptr != last)
            SEQMAP_THROW(Error(fmt::format("invalid digit found in string \"{}\"", wire)));
        return result;
    }
};

namespace detail {

template<typename S, typename = void>
struct is_key_strategy_impl : std::false_type {};

template<typename S>
struct is_key_strategy_impl<
    S, void_t<typename S::wire_type, typename S::domain_type,
              decltype(S::project(std::declval<const typename S::domain_type&>())),
              decltype(S::template lift<decode_error>(std::declval<typename S::wire_type>()))>>
    : std::is_same<decltype(S::template lift<decode_error>(std::declval<typename S::wire_type>())),
                   typename S::domain_type> {};

} // namespace detail

/// True if `S` implements the key strategy protocol.
///
/// \ingroup key_strategy
template<typename S>
struct is_key_strategy : detail::is_key_strategy_impl<S> {};

template<typename S>
constexpr bool is_key_strategy_v = is_key_strategy<S>::value;

/// Exposes the types associated with a key strategy.
///
/// \ingroup key_strategy
template<typename S>
struct key_strategy_traits {
    static_assert(is_key_strategy_v<S>,
                  "The type does not implement the key strategy protocol (wire_type, domain_type, "
                  "project() and lift<Error>()).");

    using wire_type = typename S::wire_type;
    using domain_type = typename S::domain_type;

    /// The type returned by `project()`, e.g. `const wire_type&` for borrowing strategies.
    using projected_type = decltype(S::project(std::declval<const domain_type&>()));

    static projected_type project(const domain_type& key) { return S::project(key); }

    template<typename Error>
    static domain_type lift(wire_type wire) {
        return S::template lift<Error>(std::move(wire));
    }
};

} // namespace seqmap

#endif // SEQMAP_KEY_STRATEGY_HPP
