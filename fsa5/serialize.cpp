#include "serialize.hpp"

#include "Layout.hpp"
#include "encode.hpp"
#include "linearize.hpp"
#include "resolve_layout.hpp"
#include "sink.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace fsa5 {
namespace {
bool is_empty(Automaton const& fsa) {
    return fsa.root() == 0 || fsa.first_arc(fsa.root()) == 0;
}

void write_header(std::ostream&          stream,
                  SerializeConfig const& config,
                  Layout const&          layout) {
    std::array<uint8_t, header_size> header{};
    auto iter = std::ranges::copy(magic, header.begin()).out;
    *iter++   = version;
    *iter++   = config.filler;
    *iter++   = config.annotation;
    *iter++   = pack_lengths(layout.nodeDataLength, layout.gotoLength);
    write_bytes(stream, header);
}
} // namespace

std::ostream& serialize(std::ostream&          stream,
                        SerializeConfig const& config,
                        Automaton const&       fsa) {
    Layout layout;
    if (!is_empty(fsa)) {
        layout.states = linearize(fsa);
    }

    if (config.withNumbers && !layout.states.empty()) {
        if (!config.numberProvider) {
            throw std::invalid_argument{"numberProvider is empty"};
        }
        layout.numbers = config.numberProvider(fsa);
        // the root's right language contains every other state's
        auto const iter = layout.numbers.find(fsa.root());
        layout.nodeDataLength =
            node_data_length(iter == layout.numbers.end() ? 0 : iter->second);
    }

    resolve_goto_length(fsa, layout);

    write_header(stream, config, layout);
    write_layout(stream, fsa, layout);
    return stream;
}
} // namespace fsa5
