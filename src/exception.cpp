#include <seqmap/exception.hpp>

#include <fmt/format.h>

namespace seqmap {

shape_error::shape_error(data_shape expected, data_shape got)
    : exception(fmt::format("invalid type: expected a {}, got {}", to_string(expected), to_string(got)))
    , m_expected(expected)
    , m_got(got) {}

static void format_exception_impl(std::string& out, const std::exception& e, int depth) {
    if (depth > 0) {
        out += "\n";
        out.append(static_cast<size_t>(depth) * 2, ' ');
        out += "caused by: ";
    }
    out += e.what();

    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        format_exception_impl(out, nested, depth + 1);
    }
}

std::string format_exception(const std::exception& e) {
    std::string result;
    format_exception_impl(result, e, 0);
    return result;
}

} // namespace seqmap
