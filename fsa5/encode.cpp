#include "encode.hpp"

#include <stdexcept>
#include <string>

namespace fsa5 {
std::optional<EncodedBytes> encode_arc(size_t const   gotoLength,
                                       uint8_t const  flags,
                                       Label const    label,
                                       uint64_t const targetOffset) {
    if (gotoLength == 0 || gotoLength > max_goto_length) {
        throw std::invalid_argument{"Invalid goto length: " +
                                    std::to_string(gotoLength)};
    }
    // the shift itself would lose bits
    if ((targetOffset >> (64 - address_shift)) != 0) {
        return {};
    }

    size_t const wordBytes = (flags & TargetNext) != 0 ? 1 : gotoLength;
    uint64_t     word      = (targetOffset << address_shift) | flags;

    EncodedBytes out;
    out.bytes[out.size++] = label;
    for (size_t i = 0; i < wordBytes; ++i) {
        out.bytes[out.size++] = static_cast<uint8_t>(word);
        word >>= 8;
    }
    if (word != 0) {
        // goto length too small
        return {};
    }
    return out;
}

EncodedBytes encode_node_data(size_t const nodeDataLength, uint64_t number) {
    if (nodeDataLength > max_node_data_length) {
        throw std::invalid_argument{"Invalid node data length: " +
                                    std::to_string(nodeDataLength)};
    }
    EncodedBytes out;
    for (size_t i = 0; i < nodeDataLength; ++i) {
        out.bytes[out.size++] = static_cast<uint8_t>(number);
        number >>= 8;
    }
    return out;
}

size_t node_data_length(uint64_t maxNumber) {
    size_t out = 0;
    while (maxNumber > 0) {
        ++out;
        maxNumber >>= 8;
    }
    return out;
}

uint8_t pack_lengths(size_t const nodeDataLength, size_t const gotoLength) {
    return static_cast<uint8_t>((nodeDataLength << 4) | gotoLength);
}
} // namespace fsa5
