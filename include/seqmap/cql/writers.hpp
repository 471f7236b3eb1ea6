#ifndef SEQMAP_CQL_WRITERS_HPP
#define SEQMAP_CQL_WRITERS_HPP

#include <seqmap/cql/endian.hpp>
#include <seqmap/defs.hpp>

#include <limits>
#include <vector>

namespace seqmap::cql {

/// The largest cell permitted by the protocol: the length
/// prefix of a cell is a signed 32-bit integer.
constexpr size_t max_cell_size = static_cast<size_t>(std::numeric_limits<i32>::max());

class cell_value_builder;

/**
 * Writes a single cell into a byte buffer.
 *
 * A cell is a signed 32-bit big endian length followed by that many bytes.
 * A negative length represents null.
 *
 * Cell writers append to the buffer. Each writer is meant to produce exactly one
 * cell, either directly (`set_null()`, `set_value()`) or incrementally through a
 * \ref cell_value_builder. Bytes that were in the buffer before the writer was
 * created are never modified; a cell that fails to complete is removed again
 * (see \ref cell_value_builder::rollback).
 */
class cell_writer {
public:
    /// Creates a writer that appends to `buffer`. Cells (including nested cells)
    /// must not be larger than `size_limit` bytes.
    explicit cell_writer(std::vector<byte>& buffer, size_t size_limit = max_cell_size);

    /// Writes a null cell.
    void set_null();

    /// Writes a cell with the given content.
    ///
    /// \throws cell_overflow_error If `size` exceeds the size limit.
    void set_value(const byte* data, size_t size);

    /// Starts a cell whose content is written piece by piece.
    cell_value_builder into_value_builder();

    size_t size_limit() const { return m_size_limit; }

private:
    std::vector<byte>* m_buffer;
    size_t m_size_limit;
};

/**
 * Builds the content of a cell incrementally.
 *
 * The length prefix is reserved when the builder is created and
 * filled in by `finish()`.
 */
class cell_value_builder {
public:
    /// Appends raw bytes to the cell.
    void append_bytes(const byte* data, size_t size);

    /// Appends a number in big endian format.
    template<typename T>
    void append_number(T value) {
        byte buffer[sizeof(T)];
        detail::store_big_endian(value, buffer);
        append_bytes(buffer, sizeof(T));
    }

    /// Returns a writer for a nested cell that is appended to this cell's content.
    cell_writer make_sub_writer();

    /// Completes the cell by writing its length.
    ///
    /// \throws cell_overflow_error If the cell's content exceeds the size limit.
    ///         The incomplete cell is rolled back in that case.
    void finish();

    /// Removes the incomplete cell (length prefix included) from the buffer,
    /// restoring the size the buffer had when the builder was created.
    void rollback();

    /// The number of content bytes written so far (not counting the length prefix).
    size_t size() const;

private:
    friend cell_writer;

    cell_value_builder(std::vector<byte>& buffer, size_t size_limit);

private:
    std::vector<byte>* m_buffer;
    size_t m_start;
    size_t m_size_limit;
};

} // namespace seqmap::cql

#endif // SEQMAP_CQL_WRITERS_HPP
