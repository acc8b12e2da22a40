#ifndef fsa5_test_Fsa5Reader_hpp
#define fsa5_test_Fsa5Reader_hpp

#include "../Format.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fsa5::test {
using Bytes = std::vector<uint8_t>;

inline Bytes to_bytes(std::string const& s) {
    return {s.begin(), s.end()};
}

// Decodes a serialized automaton straight from its bytes.  Nodes and arcs
// are offsets from the first byte after the header.
class Fsa5Reader {
  public:
    explicit Fsa5Reader(Bytes bytes)
        : bytes_{std::move(bytes)} {
        if (bytes_.size() < header_size ||
            !std::equal(magic.begin(), magic.end(), bytes_.begin()) ||
            bytes_[magic.size()] != version) {
            throw std::runtime_error{"not an FSA5 automaton"};
        }
        filler_         = bytes_[magic.size() + 1];
        annotation_     = bytes_[magic.size() + 2];
        nodeDataLength_ = bytes_[magic.size() + 3] >> 4;
        gotoLength_     = bytes_[magic.size() + 3] & 0x0f;
        bytes_.erase(bytes_.begin(), bytes_.begin() + header_size);
    }

    uint8_t filler() const {
        return filler_;
    }

    uint8_t annotation() const {
        return annotation_;
    }

    size_t node_data_length() const {
        return nodeDataLength_;
    }

    size_t goto_length() const {
        return gotoLength_;
    }

    Bytes const& body() const {
        return bytes_;
    }

    // the epsilon state follows the dummy terminal state
    uint64_t epsilon_node() const {
        return skip_arc(first_arc(0));
    }

    // 0 for the empty automaton
    uint64_t root() const {
        auto const a = first_arc(epsilon_node());
        return is_terminal(a) ? 0 : end_node(a);
    }

    uint64_t first_arc(uint64_t const node) const {
        return node + nodeDataLength_;
    }

    uint64_t next_arc(uint64_t const arc) const {
        return is_last(arc) ? 0 : skip_arc(arc);
    }

    uint64_t skip_arc(uint64_t const arc) const {
        return arc + 1 + (is_target_next(arc) ? 1 : gotoLength_);
    }

    uint8_t label(uint64_t const arc) const {
        return at(arc);
    }

    uint8_t flags(uint64_t const arc) const {
        return at(arc + 1) & ((1 << address_shift) - 1);
    }

    bool is_final(uint64_t const arc) const {
        return (flags(arc) & FinalArc) != 0;
    }

    bool is_last(uint64_t const arc) const {
        return (flags(arc) & LastArc) != 0;
    }

    bool is_target_next(uint64_t const arc) const {
        return (flags(arc) & TargetNext) != 0;
    }

    uint64_t address(uint64_t const arc) const {
        return little_endian(arc + 1, gotoLength_) >> address_shift;
    }

    bool is_terminal(uint64_t const arc) const {
        return !is_target_next(arc) && address(arc) == 0;
    }

    uint64_t end_node(uint64_t const arc) const {
        return is_target_next(arc) ? skip_arc(arc) : address(arc);
    }

    uint64_t number(uint64_t const node) const {
        return little_endian(node, nodeDataLength_);
    }

    std::vector<uint64_t> arcs(uint64_t const node) const {
        std::vector<uint64_t> out;
        for (auto a = first_arc(node); a != 0; a = next_arc(a)) {
            out.push_back(a);
        }
        return out;
    }

    // every accepted sequence in arc order
    std::vector<std::string> sequences() const {
        std::vector<std::string> out;
        if (auto const r = root(); r != 0) {
            collect(r, "", out);
        }
        return out;
    }

    bool contains(std::string const& s) const {
        return perfect_hash(s).has_value();
    }

    // the position of s among the accepted sequences; needs numbers
    std::optional<uint64_t> perfect_hash(std::string const& s) const {
        auto node = root();
        if (node == 0 || s.empty()) {
            return {};
        }
        uint64_t hash = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            auto const c   = static_cast<uint8_t>(s[i]);
            auto       arc = first_arc(node);
            for (; arc != 0 && label(arc) != c; arc = next_arc(arc)) {
                hash += right_language(arc);
            }
            if (arc == 0) {
                return {};
            }
            if (i + 1 == s.size()) {
                if (is_final(arc)) {
                    return hash;
                }
                return {};
            }
            if (is_final(arc)) {
                ++hash;
            }
            if (is_terminal(arc)) {
                return {};
            }
            node = end_node(arc);
        }
        return {};
    }

  private:
    uint8_t at(uint64_t const i) const {
        if (i >= bytes_.size()) {
            throw std::out_of_range{"read past the end at " +
                                    std::to_string(i)};
        }
        return bytes_[i];
    }

    uint64_t little_endian(uint64_t const offset, size_t const n) const {
        uint64_t out = 0;
        for (size_t i = n; i > 0; --i) {
            out = (out << 8) | at(offset + i - 1);
        }
        return out;
    }

    uint64_t right_language(uint64_t const arc) const {
        return (is_final(arc) ? 1 : 0) +
               (is_terminal(arc) ? 0 : number(end_node(arc)));
    }

    void collect(uint64_t const            node,
                 std::string const&        prefix,
                 std::vector<std::string>& out) const {
        for (auto const a : arcs(node)) {
            auto const s = prefix + static_cast<char>(label(a));
            if (is_final(a)) {
                out.push_back(s);
            }
            if (!is_terminal(a)) {
                collect(end_node(a), s, out);
            }
        }
    }

    Bytes   bytes_;
    uint8_t filler_;
    uint8_t annotation_;
    size_t  nodeDataLength_;
    size_t  gotoLength_;
};
} // namespace fsa5::test

#endif // include guard
