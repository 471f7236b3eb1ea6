#ifndef SEQMAP_ASSERT_HPP
#define SEQMAP_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// @{

#ifndef NDEBUG

/// SEQMAP_DEBUG is defined when this library is used in debug mode.
#    define SEQMAP_DEBUG

#endif

#ifdef SEQMAP_DEBUG

/// When in debug mode, check against the given condition
/// and abort the program with a message if the check fails.
/// Does nothing in release mode.
#    define SEQMAP_ASSERT(cond, message)                                             \
        do {                                                                         \
            if (!(cond)) {                                                           \
                ::seqmap::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
            }                                                                        \
        } while (0)

#else

#    define SEQMAP_ASSERT(cond, message)

#endif

/// Unconditionally terminate the program when unreachable code is executed.
#define SEQMAP_UNREACHABLE(message) \
    (::seqmap::detail::unreachable_impl(__FILE__, __LINE__, (message)))

/// @}

/// \cond INTERNAL
namespace seqmap::detail {

[[noreturn]] void assert_impl(const char* file, int line, const char* cond, const char* message);
[[noreturn]] void unreachable_impl(const char* file, int line, const char* message);

} // namespace seqmap::detail
/// \endcond

#endif // SEQMAP_ASSERT_HPP
