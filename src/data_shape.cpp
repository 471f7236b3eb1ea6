#include <seqmap/data_shape.hpp>

#include <seqmap/assert.hpp>

namespace seqmap {

std::string_view to_string(data_shape shape) {
    switch (shape) {
    case data_shape::undefined:
        return "undefined";
    case data_shape::null:
        return "null";
    case data_shape::scalar:
        return "scalar";
    case data_shape::sequence:
        return "sequence";
    case data_shape::map:
        return "map";
    }
    SEQMAP_UNREACHABLE("invalid data shape");
}

} // namespace seqmap
