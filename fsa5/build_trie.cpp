#include "build_trie.hpp"

#include <unordered_map>

namespace fsa5 {
ByteAutomaton build_trie(std::set<std::string> const& sequences) {
    for (auto const& s : sequences) {
        if (s.empty()) {
            throw InvalidSequence{s};
        }
    }

    ByteAutomaton out;
    out.root(out.add_state());

    // a map from a stem to the state reached after reading it
    std::unordered_map<std::string, StateId> stemStates{{"", out.root()}};

    for (auto const& text : sequences) {
        std::string stem;
        StateId     previousState = out.root();
        for (size_t i = 0; i < text.size(); ++i) {
            stem += text[i];
            // sequences are sorted, so a stem seen before already has its arc
            auto [iter, success] = stemStates.emplace(stem, 0);
            if (success) {
                iter->second = out.add_state();
                out.add_arc(previousState,
                            static_cast<Label>(text[i]),
                            iter->second,
                            i + 1 == text.size());
            }
            previousState = iter->second;
        }
    }

    return out;
}

InvalidSequence::InvalidSequence(std::string s)
    : std::invalid_argument{"Invalid sequence: \"" + s + "\""} {}
} // namespace fsa5
