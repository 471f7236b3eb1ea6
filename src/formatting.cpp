#include <seqmap/formatting.hpp>

namespace seqmap {

std::string format_hex(const byte* data, size_t size, size_t numbers_per_line) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string result;
    if (data == nullptr || size == 0)
        return result;

    result.reserve(3 * size);
    size_t in_line = 0;
    for (size_t i = 0; i < size; ++i) {
        if (i > 0) {
            if (in_line >= numbers_per_line) {
                result += '\n';
                in_line = 0;
            } else {
                result += ' ';
            }
        }
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0F];
        ++in_line;
    }
    return result;
}

} // namespace seqmap
