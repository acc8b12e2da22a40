#include "right_language.hpp"

#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

namespace fsa5 {
namespace {
struct Frame {
    StateId  state;
    // the next arc of state still to be counted
    ArcId    arc;
    uint64_t count;
};

// total += n, the count of state must still fit
void add_count(uint64_t& total, uint64_t const n, StateId const state) {
    if (n > std::numeric_limits<uint64_t>::max() - total) {
        throw CountOverflow{state};
    }
    total += n;
}
} // namespace

RightLanguageCounts right_language_counts(Automaton const& fsa) {
    RightLanguageCounts out;
    if (fsa.root() == 0) {
        return out;
    }

    // post-order walk with an explicit stack; states on the stack are the
    // current path, so meeting one again is a cycle.
    std::unordered_set<StateId> onPath{fsa.root()};
    std::vector<Frame>          stack{{fsa.root(), fsa.first_arc(fsa.root()), 0}};
    while (!stack.empty()) {
        auto& top = stack.back();
        if (top.arc == 0) {
            auto const [state, arc, count] = top;
            out.emplace(state, count);
            onPath.erase(state);
            stack.pop_back();
            if (!stack.empty()) {
                add_count(stack.back().count, count, stack.back().state);
                stack.back().arc = fsa.next_arc(stack.back().arc);
            }
            continue;
        }

        auto const a = top.arc;
        if (fsa.is_final(a)) {
            add_count(top.count, 1, top.state);
        }
        if (fsa.is_terminal(a)) {
            top.arc = fsa.next_arc(a);
            continue;
        }

        auto const target = fsa.target_state(a);
        if (auto const iter = out.find(target); iter != out.end()) {
            add_count(top.count, iter->second, top.state);
            top.arc = fsa.next_arc(a);
            continue;
        }
        if (onPath.contains(target)) {
            throw CyclicAutomaton{target};
        }
        // the parent's arc advances once the target is finished
        onPath.insert(target);
        stack.push_back(Frame{target, fsa.first_arc(target), 0});
    }
    return out;
}

CyclicAutomaton::CyclicAutomaton(StateId const s)
    : std::invalid_argument{"Automaton has a cycle through state " +
                            std::to_string(s)} {}

CountOverflow::CountOverflow(StateId const s)
    : std::overflow_error{"Right language count of state " +
                          std::to_string(s) + " does not fit in 64 bits"} {}
} // namespace fsa5
