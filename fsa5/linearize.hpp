#ifndef fsa5_linearize_hpp
#define fsa5_linearize_hpp

#include "Automaton.hpp"

#include <vector>

namespace fsa5 {
/// Order every state reachable from the root, each exactly once, in
/// depth-first discovery order.  This order fixes where each state lands in
/// the serialized stream.
///
/// Terminal arcs have no target to visit.  Shared and cyclic targets are
/// visited once.  A root of 0 yields an empty sequence.
std::vector<StateId> linearize(Automaton const&);
} // namespace fsa5

#endif // include guard
