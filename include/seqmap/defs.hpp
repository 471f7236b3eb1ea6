#ifndef SEQMAP_DEFS_HPP
#define SEQMAP_DEFS_HPP

#include <climits>
#include <cstddef>
#include <cstdint>

namespace seqmap {

/// \defgroup defs Definitions
/// @{

/// Fixed size integers, as used by the binary cell formats and by the
/// integer key strategies.
using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

/// Raw bytes of serialized values.
using byte = unsigned char;

using std::size_t;

// Serialized cells are sequences of octets.
static_assert(CHAR_BIT == 8, "seqmap requires 8-bit bytes.");

// Marks sink and source parameters that an implementation does not need.
template<typename... Args>
void unused(Args&&...) {}

/// @}

} // namespace seqmap

#endif // SEQMAP_DEFS_HPP
