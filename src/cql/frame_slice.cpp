#include <seqmap/cql/frame_slice.hpp>

#include <seqmap/cql/errors.hpp>

#include <fmt/format.h>

namespace seqmap::cql {

frame_slice frame_slice::read_bytes(size_t count) {
    if (count > m_size) {
        SEQMAP_THROW(frame_error(
            fmt::format("Expected {} more bytes, but only {} are available.", count, m_size)));
    }

    frame_slice result(m_data, count);
    m_data += count;
    m_size -= count;
    return result;
}

std::optional<frame_slice> frame_slice::read_cell() {
    frame_slice rest = *this;
    const i32 length = rest.read_number<i32>();
    if (length < 0) {
        *this = rest;
        return {};
    }

    frame_slice content = rest.read_bytes(static_cast<size_t>(length));
    *this = rest;
    return content;
}

} // namespace seqmap::cql
