#ifndef SEQMAP_CQL_FRAME_SLICE_HPP
#define SEQMAP_CQL_FRAME_SLICE_HPP

#include <seqmap/cql/endian.hpp>
#include <seqmap/defs.hpp>

#include <optional>
#include <vector>

namespace seqmap::cql {

/**
 * A read cursor over (a part of) a response frame.
 *
 * The slice does not own the bytes it refers to; the underlying buffer
 * must outlive the slice and all slices created from it.
 *
 * Reading functions throw \ref frame_error if the slice does not contain
 * enough bytes. The slice is not modified in that case.
 */
class frame_slice {
public:
    frame_slice() = default;

    frame_slice(const byte* data, size_t size)
        : m_data(data)
        , m_size(size) {}

    explicit frame_slice(const std::vector<byte>& bytes)
        : frame_slice(bytes.data(), bytes.size()) {}

    const byte* data() const { return m_data; }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }

    /// Reads the next `count` bytes.
    frame_slice read_bytes(size_t count);

    /// Reads a big endian number.
    template<typename T>
    T read_number() {
        frame_slice bytes = read_bytes(sizeof(T));
        return detail::load_big_endian<T>(bytes.data());
    }

    /// Reads the next cell, i.e. a signed 32-bit length followed by that many bytes.
    /// Returns an empty optional if the cell is null (negative length).
    std::optional<frame_slice> read_cell();

private:
    const byte* m_data = nullptr;
    size_t m_size = 0;
};

} // namespace seqmap::cql

#endif // SEQMAP_CQL_FRAME_SLICE_HPP
