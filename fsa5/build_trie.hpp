#ifndef fsa5_build_trie_hpp
#define fsa5_build_trie_hpp

#include "ByteAutomaton.hpp"

#include <set>
#include <stdexcept>
#include <string>

namespace fsa5 {
/// Construct a trie accepting exactly the provided byte sequences.
///
/// The arcs of every state are added in increasing label order, so the
/// perfect hash of a sequence is its position in sequences.  Common prefixes
/// share states, common suffixes do not.
///
/// Requirements:
/// Every sequence must be non-empty.
ByteAutomaton build_trie(std::set<std::string> const& sequences);

struct InvalidSequence : std::invalid_argument {
    InvalidSequence(std::string);
};
} // namespace fsa5

#endif // include guard
