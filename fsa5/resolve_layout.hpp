#ifndef fsa5_resolve_layout_hpp
#define fsa5_resolve_layout_hpp

#include "Layout.hpp"

#include <optional>
#include <ostream>

namespace fsa5 {
/// Dry run at layout.gotoLength: record the offset of every state in
/// layout.offsets without writing anything.
///
/// Returns the number of bytes the states would take, or an empty optional
/// as soon as an address does not fit in gotoLength bytes.
std::optional<uint64_t> layout_pass(Automaton const&, Layout&);

/// Find the smallest goto length for which two consecutive dry runs fit,
/// store it in layout.gotoLength and return it.
///
/// Offsets depend on the goto length and addresses depend on offsets.  The
/// first run places every state for this goto length but checks forward
/// addresses against offsets left by an earlier run; the second run checks
/// every address against the offsets of the first.
size_t resolve_goto_length(Automaton const&, Layout&);

/// An upper bound for the goto length: the width that fits any offset even
/// if no arc used TargetNext.
size_t goto_length_bound(Automaton const&, Layout const&);

/// Write the states to stream.  Every state must land on the offset the dry
/// runs recorded; otherwise throws LayoutInconsistency.
void write_layout(std::ostream& stream, Automaton const&, Layout const&);
} // namespace fsa5

#endif // include guard
