#include <seqmap/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace seqmap::detail {

static bool has_text(const char* message) {
    return message != nullptr && *message != '\0';
}

void assert_impl(const char* file, int line, const char* cond, const char* message) {
    if (has_text(message)) {
        fmt::print(stderr, "seqmap: assertion `{}` failed: {}\n    at {}:{}\n", cond, message, file, line);
    } else {
        fmt::print(stderr, "seqmap: assertion `{}` failed\n    at {}:{}\n", cond, file, line);
    }
    std::fflush(stderr);
    std::abort();
}

void unreachable_impl(const char* file, int line, const char* message) {
    fmt::print(stderr, "seqmap: unreachable code reached ({})\n    at {}:{}\n",
               has_text(message) ? message : "no details", file, line);
    std::fflush(stderr);
    std::abort();
}

} // namespace seqmap::detail
