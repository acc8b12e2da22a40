#ifndef fsa5_serialize_hpp
#define fsa5_serialize_hpp

#include "Automaton.hpp"
#include "Format.hpp"
#include "right_language.hpp"

#include <cstdint>
#include <ostream>

namespace fsa5 {
struct SerializeConfig {
    // copied into the header, otherwise unused
    uint8_t filler     = default_filler;
    uint8_t annotation = default_annotation;

    // store each state's right language count for perfect hashing
    bool withNumbers = false;

    // only called when withNumbers is set, and then must not be empty
    NumberProvider numberProvider = right_language_counts;
};

/// Serialize fsa to stream in FSA5 format and return stream.
///
/// An automaton whose root is 0 or has no arcs is written as the empty
/// automaton.  With numbers, an empty numberProvider throws
/// std::invalid_argument and right_language_counts may throw CyclicAutomaton
/// or CountOverflow, all before anything is written.  On any exception the stream holds a partial automaton and
/// must be discarded.
std::ostream& serialize(std::ostream&          stream,
                        SerializeConfig const& config,
                        Automaton const&       fsa);
} // namespace fsa5

#endif // include guard
