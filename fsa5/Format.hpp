#ifndef fsa5_Format_hpp
#define fsa5_Format_hpp

#include <array>
#include <cstddef>
#include <cstdint>
#include <set>

namespace fsa5 {
// Bits in the low byte of every arc's flags/address word.
enum ArcFlags : uint8_t {
    // the arc completes an accepted sequence
    FinalArc = 1 << 0,
    // the arc is the last one of its state
    LastArc = 1 << 1,
    // the target is the state that immediately follows in the stream, so no
    // address is stored
    TargetNext = 1 << 2,
};

// the address is stored above the flag bits
inline constexpr unsigned address_shift = 3;

inline constexpr std::array<uint8_t, 4> magic{'\\', 'f', 's', 'a'};
inline constexpr uint8_t                version = 5;

inline constexpr uint8_t default_filler     = '_';
inline constexpr uint8_t default_annotation = '+';

// magic, version, filler, annotation, packed lengths
inline constexpr size_t header_size = magic.size() + 4;

// Offsets and counts are 64 bit.
inline constexpr size_t max_goto_length      = 8;
inline constexpr size_t max_node_data_length = 8;

// label byte plus the widest flags/address word
inline constexpr size_t max_arc_size = 1 + max_goto_length;

// Capabilities advertised by a serialized automaton.
enum class FormatFlag : uint16_t {
    Flexible   = 1 << 0,
    StopBit    = 1 << 1,
    NextBit    = 1 << 2,
    Tails      = 1 << 3,
    Numbers    = 1 << 8,
    Separators = 1 << 9,
};

// The flags this serializer's output supports.
std::set<FormatFlag> supported_flags();

uint16_t flags_mask(std::set<FormatFlag> const&);
} // namespace fsa5

#endif // include guard
