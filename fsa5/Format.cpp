#include "Format.hpp"

namespace fsa5 {
std::set<FormatFlag> supported_flags() {
    return {FormatFlag::Numbers,
            FormatFlag::Separators,
            FormatFlag::Flexible,
            FormatFlag::StopBit,
            FormatFlag::NextBit};
}

uint16_t flags_mask(std::set<FormatFlag> const& flags) {
    uint16_t out = 0;
    for (auto const f : flags) {
        out |= static_cast<uint16_t>(f);
    }
    return out;
}
} // namespace fsa5
