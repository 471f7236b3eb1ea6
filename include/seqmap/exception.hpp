#ifndef SEQMAP_EXCEPTION_HPP
#define SEQMAP_EXCEPTION_HPP

#include <seqmap/data_shape.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/// @defgroup exception_support Exception support macros
/// @{

/**
 * Expands to the current source location (file, line, function).
 */
#define SEQMAP_SOURCE_LOCATION (::seqmap::source_location(__FILE__, __LINE__, __func__))

/**
 * Augments an @ref seqmap::exception with the current source location.
 */
#define SEQMAP_AUGMENT_EXCEPTION(e) (::seqmap::detail::with_location((e), SEQMAP_SOURCE_LOCATION))

/**
 * Throw the given @ref seqmap::exception with added source location information.
 */
#define SEQMAP_THROW(e) throw(SEQMAP_AUGMENT_EXCEPTION(e))

/**
 * Throw a new @ref seqmap::exception `e` with added source location information
 * and the currently active exception (if any) as its cause.
 */
#define SEQMAP_THROW_NESTED(e) (::std::throw_with_nested(SEQMAP_AUGMENT_EXCEPTION(e)))

/// @}

namespace seqmap {

/**
 * Represents the source code location at which an exception was thrown.
 */
class source_location {
public:
    source_location() = default;

    source_location(const char* file, int line, const char* function)
        : m_file(file)
        , m_line(line)
        , m_function(function) {}

    const char* file() const { return m_file; }
    int line() const { return m_line; }
    const char* function() const { return m_function; }

private:
    const char* m_file = "";
    int m_line = 0;
    const char* m_function = "";
};

class exception;

namespace detail {

template<typename Exception>
Exception with_location(Exception&& e, const source_location& where) {
    static_assert(std::is_base_of<exception, std::decay_t<Exception>>::value,
                  "Exception must be derived from seqmap::exception.");
    e.set_where(where);
    return std::forward<Exception>(e);
}

} // namespace detail

/**
 * Base class for all exceptions thrown by this library.
 */
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    /**
     * Returns the source code location that threw this exception.
     *
     * \note Requires that the exception was thrown using
     * @ref SEQMAP_THROW or @ref SEQMAP_THROW_NESTED, otherwise `where()`
     * will return an empty source location.
     */
    const source_location& where() const { return m_where; }

private:
    template<typename T>
    friend T detail::with_location(T&&, const source_location&);

    void set_where(const source_location& loc) { m_where = loc; }

private:
    source_location m_where;
};

/**
 * Thrown when a value read from a structured-data source could not be
 * converted into its in-memory representation, e.g. because a key strategy
 * rejected a wire key. The original cause (if any) is attached as a nested exception.
 */
class decode_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when a structured-data sink fails to accept a value.
 */
class encode_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when a structured-data source does not have the expected shape,
 * e.g. when a map was expected but a sequence was found.
 */
class shape_error : public exception {
public:
    shape_error(data_shape expected, data_shape got);

    data_shape expected() const { return m_expected; }
    data_shape got() const { return m_got; }

private:
    data_shape m_expected;
    data_shape m_got;
};

/**
 * Exceptions of this class or its subclasses are thrown when an object
 * is being misused, i.e. it is being passed the wrong arguments
 * or it is in the wrong state.
 */
class usage_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when an invalid argument is being passed to some operation.
 */
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Renders the message of `e` followed by the messages of all
 * nested exceptions (see std::nested_exception), one per line.
 */
std::string format_exception(const std::exception& e);

} // namespace seqmap

#endif // SEQMAP_EXCEPTION_HPP
