#include <seqmap/cql/writers.hpp>

#include <seqmap/cql/errors.hpp>
#include <seqmap/logging.hpp>

#include <fmt/format.h>

namespace seqmap::cql {

static constexpr size_t length_size = sizeof(i32);

static void write_length(byte* buffer, i32 length) {
    detail::store_big_endian(length, buffer);
}

cell_writer::cell_writer(std::vector<byte>& buffer, size_t size_limit)
    : m_buffer(&buffer)
    , m_size_limit(size_limit < max_cell_size ? size_limit : max_cell_size) {}

void cell_writer::set_null() {
    byte length[length_size];
    write_length(length, -1);
    m_buffer->insert(m_buffer->end(), length, length + length_size);
}

void cell_writer::set_value(const byte* data, size_t size) {
    if (size > m_size_limit) {
        SEQMAP_THROW(cell_overflow_error(
            fmt::format("Cell of {} bytes exceeds the size limit of {} bytes.", size, m_size_limit)));
    }

    byte length[length_size];
    write_length(length, static_cast<i32>(size));
    m_buffer->insert(m_buffer->end(), length, length + length_size);
    m_buffer->insert(m_buffer->end(), data, data + size);
}

cell_value_builder cell_writer::into_value_builder() {
    return cell_value_builder(*m_buffer, m_size_limit);
}

cell_value_builder::cell_value_builder(std::vector<byte>& buffer, size_t size_limit)
    : m_buffer(&buffer)
    , m_start(buffer.size())
    , m_size_limit(size_limit) {
    // Placeholder for the length, see finish().
    m_buffer->resize(m_buffer->size() + length_size);
}

void cell_value_builder::append_bytes(const byte* data, size_t size) {
    m_buffer->insert(m_buffer->end(), data, data + size);
}

cell_writer cell_value_builder::make_sub_writer() {
    return cell_writer(*m_buffer, m_size_limit);
}

size_t cell_value_builder::size() const {
    return m_buffer->size() - m_start - length_size;
}

void cell_value_builder::finish() {
    const size_t content_size = size();
    if (content_size > m_size_limit) {
        logger()->debug("Cell of {} bytes exceeds the size limit of {} bytes", content_size,
                        m_size_limit);
        rollback();
        SEQMAP_THROW(cell_overflow_error(fmt::format(
            "Cell of {} bytes exceeds the size limit of {} bytes.", content_size, m_size_limit)));
    }
    write_length(m_buffer->data() + m_start, static_cast<i32>(content_size));
}

void cell_value_builder::rollback() {
    m_buffer->resize(m_start);
}

} // namespace seqmap::cql
