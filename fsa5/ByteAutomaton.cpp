#include "ByteAutomaton.hpp"

#include <algorithm>
#include <string>

namespace fsa5 {
namespace {
// An ArcId packs the owning state and the arc's position in that state.
// Labels are unique per state so a state never has more than 256 arcs.
constexpr size_t arcs_per_state = 512;

ArcId make_arc_id(StateId const s, size_t const i) {
    return s * arcs_per_state + i + 1;
}

StateId arc_state(ArcId const a) {
    return (a - 1) / arcs_per_state;
}

size_t arc_index(ArcId const a) {
    return (a - 1) % arcs_per_state;
}
} // namespace

ByteAutomaton::ByteAutomaton()
    : states_(1)
    , root_{0}
    , numArcs_{0} {}

StateId ByteAutomaton::add_state() {
    states_.emplace_back();
    return states_.size() - 1;
}

void ByteAutomaton::add_arc(StateId const from,
                            Label const   label,
                            StateId const target,
                            bool const    final) {
    check_state(from, false);
    check_state(target, true);
    auto& arcs = states_[from];
    if (std::ranges::any_of(
            arcs, [label](auto const& a) { return a.label == label; })) {
        throw DuplicateLabel{from, label};
    }
    arcs.push_back(Arc{label, target, final});
    ++numArcs_;
}

void ByteAutomaton::root(StateId const s) {
    check_state(s, true);
    root_ = s;
}

size_t ByteAutomaton::num_states() const {
    return states_.size() - 1;
}

size_t ByteAutomaton::num_arcs() const {
    return numArcs_;
}

std::vector<ByteAutomaton::Arc> const& ByteAutomaton::arcs(
    StateId const s) const {
    check_state(s, true);
    return states_[s];
}

StateId ByteAutomaton::root() const {
    return root_;
}

ArcId ByteAutomaton::first_arc(StateId const s) const {
    if (arcs(s).empty()) {
        return 0;
    }
    return make_arc_id(s, 0);
}

ArcId ByteAutomaton::next_arc(ArcId const a) const {
    arc(a);
    auto const i = arc_index(a);
    if (i + 1 < states_[arc_state(a)].size()) {
        return make_arc_id(arc_state(a), i + 1);
    }
    return 0;
}

Label ByteAutomaton::label(ArcId const a) const {
    return arc(a).label;
}

bool ByteAutomaton::is_final(ArcId const a) const {
    return arc(a).final;
}

bool ByteAutomaton::is_terminal(ArcId const a) const {
    auto const target = arc(a).target;
    return target == 0 || states_[target].empty();
}

StateId ByteAutomaton::target_state(ArcId const a) const {
    return arc(a).target;
}

ByteAutomaton::Arc const& ByteAutomaton::arc(ArcId const a) const {
    if (a == 0 || arc_state(a) >= states_.size() ||
        arc_index(a) >= states_[arc_state(a)].size()) {
        throw std::out_of_range{"invalid arc: " + std::to_string(a)};
    }
    return states_[arc_state(a)][arc_index(a)];
}

void ByteAutomaton::check_state(StateId const s, bool const allowNone) const {
    if (s >= states_.size() || (s == 0 && !allowNone)) {
        throw InvalidState{s};
    }
}

InvalidState::InvalidState(StateId const s)
    : std::invalid_argument{"Invalid state: " + std::to_string(s)} {}

DuplicateLabel::DuplicateLabel(StateId const s, Label const l)
    : std::invalid_argument{"Duplicate label " + std::to_string(int{l}) +
                            " on state " + std::to_string(s)} {}
} // namespace fsa5
