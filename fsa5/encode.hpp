#ifndef fsa5_encode_hpp
#define fsa5_encode_hpp

#include "Automaton.hpp"
#include "Format.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace fsa5 {
// Bytes of one arc record or one block of node data, ready to be written as a
// single unit.
struct EncodedBytes {
    std::array<uint8_t, max_arc_size> bytes{};
    size_t                            size = 0;

    std::span<uint8_t const> view() const {
        return {bytes.data(), size};
    }
};

/// Encode one arc: the label followed by the flags/address word.
///
/// If flags contains TargetNext the word is a single byte of flags and
/// targetOffset must be 0.  Otherwise the word is gotoLength bytes holding
/// (targetOffset << address_shift) | flags, least significant byte first.
///
/// Returns an empty optional when the word does not fit in its bytes.
std::optional<EncodedBytes> encode_arc(size_t   gotoLength,
                                       uint8_t  flags,
                                       Label    label,
                                       uint64_t targetOffset);

/// Encode a state's number as nodeDataLength bytes, least significant byte
/// first.  Higher bytes of number are dropped.
EncodedBytes encode_node_data(size_t nodeDataLength, uint64_t number);

/// The smallest number of bytes that holds maxNumber; 0 for 0.
size_t node_data_length(uint64_t maxNumber);

/// The header byte holding both lengths.
uint8_t pack_lengths(size_t nodeDataLength, size_t gotoLength);
} // namespace fsa5

#endif // include guard
