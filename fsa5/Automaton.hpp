#ifndef fsa5_Automaton_hpp
#define fsa5_Automaton_hpp

#include <cstddef>
#include <cstdint>

namespace fsa5 {
// Opaque handles into an automaton.  0 is reserved in both: StateId 0 is "no
// state" (the implicit terminal state) and ArcId 0 is "no more arcs".
using StateId = size_t;
using ArcId   = size_t;
using Label   = uint8_t;

/// Read-only traversal over an automaton.  The serializer only ever sees an
/// automaton through this interface.
class Automaton {
  public:
    virtual ~Automaton() = default;

    virtual StateId root() const = 0;

    // 0 if s has no outgoing arcs
    virtual ArcId first_arc(StateId s) const = 0;

    // 0 if a is the last arc of its state
    virtual ArcId next_arc(ArcId a) const = 0;

    virtual Label label(ArcId a) const = 0;

    // a completes an accepted sequence
    virtual bool is_final(ArcId a) const = 0;

    // a has no target state
    virtual bool is_terminal(ArcId a) const = 0;

    // only meaningful if !is_terminal(a)
    virtual StateId target_state(ArcId a) const = 0;
};
} // namespace fsa5

#endif // include guard
