#ifndef fsa5_Layout_hpp
#define fsa5_Layout_hpp

#include "Automaton.hpp"
#include "right_language.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsa5 {
// state -> offset of its record from the first byte after the header
using OffsetTable = std::unordered_map<StateId, uint64_t>;

// Everything one serialization needs to place states in the stream.
struct Layout {
    // states in stream order, as produced by linearize()
    std::vector<StateId> states;

    // right language counts; empty unless serializing with numbers
    RightLanguageCounts numbers;

    // bytes of node data in front of every state's arcs
    size_t nodeDataLength = 0;

    // bytes of a full flags/address word
    size_t gotoLength = 1;

    // filled in by dry runs, checked by the real pass
    OffsetTable offsets;
};

// A reachable state without outgoing arcs cannot be represented.
struct InvalidAutomaton : std::invalid_argument {
    InvalidAutomaton(StateId);
};

// The real pass disagreed with the dry runs.  This is a bug, not bad input.
struct LayoutInconsistency : std::logic_error {
    LayoutInconsistency(std::string);
};
} // namespace fsa5

#endif // include guard
