#ifndef fsa5_right_language_hpp
#define fsa5_right_language_hpp

#include "Automaton.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace fsa5 {
// state -> number of distinct sequences accepted starting from that state
using RightLanguageCounts = std::unordered_map<StateId, uint64_t>;

// Anything that can number an automaton's states for perfect hashing.
using NumberProvider = std::function<RightLanguageCounts(Automaton const&)>;

/// Count the right language of every state reachable from the root.
///
/// The count of a state is the sum over its arcs of one for a final arc plus
/// the count of the arc's target for a non-terminal arc.  The automaton must
/// be acyclic; a cycle throws CyclicAutomaton.  A count above 2^64 - 1
/// throws CountOverflow.
RightLanguageCounts right_language_counts(Automaton const&);

struct CyclicAutomaton : std::invalid_argument {
    CyclicAutomaton(StateId);
};

struct CountOverflow : std::overflow_error {
    CountOverflow(StateId);
};
} // namespace fsa5

#endif // include guard
