#include "linearize.hpp"

#include <boost/dynamic_bitset.hpp>

#include <algorithm>

namespace fsa5 {
namespace {
class VisitedStates {
  public:
    bool contains(StateId const s) const {
        return s < bits_.size() && bits_.test(s);
    }

    void insert(StateId const s) {
        if (s >= bits_.size()) {
            bits_.resize(std::max(s + 1, 2 * bits_.size()));
        }
        bits_.set(s);
    }

  private:
    boost::dynamic_bitset<> bits_;
};
} // namespace

std::vector<StateId> linearize(Automaton const& fsa) {
    std::vector<StateId> out;
    if (fsa.root() == 0) {
        return out;
    }

    VisitedStates        visited;
    std::vector<StateId> stack{fsa.root()};
    while (!stack.empty()) {
        auto const s = stack.back();
        stack.pop_back();
        // a state can be pushed more than once before it is first popped
        if (visited.contains(s)) {
            continue;
        }
        visited.insert(s);
        out.push_back(s);

        for (auto a = fsa.first_arc(s); a != 0; a = fsa.next_arc(a)) {
            if (fsa.is_terminal(a)) {
                continue;
            }
            if (auto const target = fsa.target_state(a);
                !visited.contains(target)) {
                stack.push_back(target);
            }
        }
    }
    return out;
}
} // namespace fsa5
