#ifndef SEQMAP_DATA_SHAPE_HPP
#define SEQMAP_DATA_SHAPE_HPP

#include <string_view>

namespace seqmap {

/**
 * The coarse shape of a node in a structured-data document, as reported
 * by map sources.
 */
enum class data_shape {
    undefined,
    null,
    scalar,
    sequence,
    map,
};

std::string_view to_string(data_shape shape);

} // namespace seqmap

#endif // SEQMAP_DATA_SHAPE_HPP
