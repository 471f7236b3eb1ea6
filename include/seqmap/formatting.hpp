#ifndef SEQMAP_FORMATTING_HPP
#define SEQMAP_FORMATTING_HPP

#include <seqmap/defs.hpp>

#include <string>
#include <vector>

namespace seqmap {

// Format a byte array as a hex string ("00 00 00 02 ...").
// A linebreak will be inserted between two hex numbers if the amount of numbers
// in the current line would exceed `numbers_per_line`.
std::string format_hex(const byte* data, size_t size, size_t numbers_per_line = -1);

inline std::string format_hex(const std::vector<byte>& bytes, size_t numbers_per_line = -1) {
    return format_hex(bytes.data(), bytes.size(), numbers_per_line);
}

} // namespace seqmap

#endif // SEQMAP_FORMATTING_HPP
