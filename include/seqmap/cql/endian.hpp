#ifndef SEQMAP_CQL_ENDIAN_HPP
#define SEQMAP_CQL_ENDIAN_HPP

#include <seqmap/defs.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <limits>
#include <type_traits>

namespace seqmap::cql::detail {

// Integers and floating point numbers are stored in big endian format.
// Floating point numbers are copied into an unsigned integer of the same size first,
// which only works on platforms where float and integer endianness agree.
template<typename T>
struct big_endian_traits {
    static_assert(std::is_integral_v<T>, "Unsupported type.");
    using integer_type = T;
};

template<>
struct big_endian_traits<float> {
    static_assert(std::numeric_limits<float>::is_iec559, "float must conform to IEEE 754.");
    using integer_type = u32;
};

template<>
struct big_endian_traits<double> {
    static_assert(std::numeric_limits<double>::is_iec559, "double must conform to IEEE 754.");
    using integer_type = u64;
};

template<typename T>
void store_big_endian(T value, byte* buffer) {
    using integer_type = typename big_endian_traits<T>::integer_type;
    static_assert(sizeof(integer_type) == sizeof(T), "Unexpected datatype size.");

    integer_type num;
    std::memcpy(&num, &value, sizeof(T));
    boost::endian::native_to_big_inplace(num);
    std::memcpy(buffer, &num, sizeof(T));
}

template<typename T>
T load_big_endian(const byte* buffer) {
    using integer_type = typename big_endian_traits<T>::integer_type;
    static_assert(sizeof(integer_type) == sizeof(T), "Unexpected datatype size.");

    integer_type num;
    std::memcpy(&num, buffer, sizeof(T));
    boost::endian::big_to_native_inplace(num);

    T value;
    std::memcpy(&value, &num, sizeof(T));
    return value;
}

} // namespace seqmap::cql::detail

#endif // SEQMAP_CQL_ENDIAN_HPP
