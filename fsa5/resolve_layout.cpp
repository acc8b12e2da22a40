#include "resolve_layout.hpp"

#include "encode.hpp"
#include "sink.hpp"

namespace fsa5 {
namespace {
// Records offsets and discards bytes.
struct DryRun {
    Layout& layout;

    void state(StateId const s, uint64_t const offset) {
        layout.offsets[s] = offset;
    }

    void write(EncodedBytes const&) {}
};

// Writes bytes and checks that offsets match the dry runs.
struct RealPass {
    std::ostream& stream;
    Layout const& layout;

    void state(StateId const s, uint64_t const offset) {
        auto const iter = layout.offsets.find(s);
        if (iter == layout.offsets.end() || iter->second != offset) {
            throw LayoutInconsistency{
                "state " + std::to_string(s) + " written at offset " +
                std::to_string(offset) + " but laid out at " +
                (iter == layout.offsets.end() ? std::string{"<none>"}
                                              : std::to_string(iter->second))};
        }
    }

    void write(EncodedBytes const& bytes) {
        write_bytes(stream, bytes.view());
    }
};

uint64_t offset_of(Layout const& layout, StateId const s) {
    // forward targets read what an earlier pass left, 0 if there was none
    auto const iter = layout.offsets.find(s);
    return iter == layout.offsets.end() ? 0 : iter->second;
}

template <typename Emitter>
std::optional<uint64_t> emit_states(Automaton const& fsa,
                                    Layout const&    layout,
                                    Emitter&         emitter) {
    size_t const gtl    = layout.gotoLength;
    size_t const ndl    = layout.nodeDataLength;
    uint64_t     offset = 0;

    auto const node_data = [&](uint64_t const number) {
        emitter.write(encode_node_data(ndl, number));
        offset += ndl;
    };
    auto const arc = [&](uint8_t const  flags,
                         Label const    label,
                         uint64_t const target) {
        auto const bytes = encode_arc(gtl, flags, label, target);
        if (!bytes) {
            return false;
        }
        emitter.write(*bytes);
        offset += bytes->size;
        return true;
    };

    // dummy terminal state at offset 0
    node_data(0);
    if (!arc(0, 0, 0)) {
        return {};
    }

    // epsilon state whose only arc leads to the root, the next state
    node_data(0);
    if (!arc(layout.states.empty() ? LastArc : LastArc | TargetNext, '^', 0)) {
        return {};
    }

    auto const& states = layout.states;
    for (size_t j = 0; j < states.size(); ++j) {
        auto const s = states[j];
        emitter.state(s, offset);

        if (fsa.first_arc(s) == 0) {
            throw InvalidAutomaton{s};
        }

        if (ndl > 0) {
            auto const iter = layout.numbers.find(s);
            node_data(iter == layout.numbers.end() ? 0 : iter->second);
        }

        for (auto a = fsa.first_arc(s); a != 0; a = fsa.next_arc(a)) {
            StateId  target       = 0;
            uint64_t targetOffset = 0;
            if (!fsa.is_terminal(a)) {
                target       = fsa.target_state(a);
                targetOffset = offset_of(layout, target);
            }

            uint8_t flags = 0;
            if (fsa.is_final(a)) {
                flags |= FinalArc;
            }
            if (fsa.next_arc(a) == 0) {
                flags |= LastArc;
                // the next state starts right after this arc, so its offset
                // is never 0 even before this pass records it
                if (j + 1 < states.size() && target == states[j + 1]) {
                    flags |= TargetNext;
                    targetOffset = 0;
                }
            }

            if (!arc(flags, fsa.label(a), targetOffset)) {
                // goto length too small; stop early
                return {};
            }
        }
    }
    return offset;
}

// (size << address_shift) - 1 is the largest word any arc can hold
bool fits(uint64_t const size, size_t const gotoLength) {
    if (gotoLength >= max_goto_length) {
        return true;
    }
    return (((size << address_shift) - 1) >> (8 * gotoLength)) == 0;
}
} // namespace

std::optional<uint64_t> layout_pass(Automaton const& fsa, Layout& layout) {
    DryRun emitter{layout};
    return emit_states(fsa, layout, emitter);
}

size_t goto_length_bound(Automaton const& fsa, Layout const& layout) {
    // the dummy and epsilon states
    uint64_t numStates = 2;
    uint64_t numArcs   = 2;
    for (auto const s : layout.states) {
        ++numStates;
        for (auto a = fsa.first_arc(s); a != 0; a = fsa.next_arc(a)) {
            ++numArcs;
        }
    }

    size_t gtl = 1;
    while (!fits(numStates * layout.nodeDataLength + numArcs * (1 + gtl),
                 gtl)) {
        ++gtl;
    }
    return gtl;
}

size_t resolve_goto_length(Automaton const& fsa, Layout& layout) {
    size_t const bound = goto_length_bound(fsa, layout);
    for (size_t gtl = 1; gtl <= bound; ++gtl) {
        layout.gotoLength = gtl;
        // first run: offsets; second run: the offsets are achievable
        if (layout_pass(fsa, layout) && layout_pass(fsa, layout)) {
            return gtl;
        }
    }
    throw LayoutInconsistency{"no goto length up to " + std::to_string(bound) +
                              " fits the automaton"};
}

void write_layout(std::ostream&    stream,
                  Automaton const& fsa,
                  Layout const&    layout) {
    RealPass emitter{stream, layout};
    if (!emit_states(fsa, layout, emitter)) {
        throw LayoutInconsistency{"goto length " +
                                  std::to_string(layout.gotoLength) +
                                  " overflowed in the final pass"};
    }
}

InvalidAutomaton::InvalidAutomaton(StateId const s)
    : std::invalid_argument{"State " + std::to_string(s) +
                            " is reachable but has no outgoing arcs"} {}

LayoutInconsistency::LayoutInconsistency(std::string what)
    : std::logic_error{"Layout inconsistency: " + what} {}
} // namespace fsa5
