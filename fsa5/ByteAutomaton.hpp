#ifndef fsa5_ByteAutomaton_hpp
#define fsa5_ByteAutomaton_hpp

#include "Automaton.hpp"

#include <stdexcept>
#include <vector>

namespace fsa5 {
// A deterministic automaton over bytes held in memory.
//
// Arcs keep the order they were added in.  An arc is terminal when it points
// at state 0 or at a state without outgoing arcs.
class ByteAutomaton : public Automaton {
  public:
    struct Arc {
        Label   label;
        StateId target;
        bool    final;
    };

    ByteAutomaton();

    // returns the new state; the first state is 1
    StateId add_state();

    // append an arc from -> target labelled with label.  target may be 0.
    void add_arc(StateId from, Label label, StateId target, bool final);

    void root(StateId);

    size_t num_states() const;
    size_t num_arcs() const;

    // the arcs of s in native order
    std::vector<Arc> const& arcs(StateId s) const;

    StateId root() const override;
    ArcId   first_arc(StateId) const override;
    ArcId   next_arc(ArcId) const override;
    Label   label(ArcId) const override;
    bool    is_final(ArcId) const override;
    bool    is_terminal(ArcId) const override;
    StateId target_state(ArcId) const override;

  private:
    Arc const& arc(ArcId) const;
    void       check_state(StateId, bool allowNone) const;

    // states_[0] is the reserved "no state" and never has arcs
    std::vector<std::vector<Arc>> states_;
    StateId                       root_;
    size_t                        numArcs_;
};

struct InvalidState : std::invalid_argument {
    InvalidState(StateId);
};

struct DuplicateLabel : std::invalid_argument {
    DuplicateLabel(StateId, Label);
};
} // namespace fsa5

#endif // include guard
